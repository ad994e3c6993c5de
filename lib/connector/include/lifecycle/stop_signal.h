#pragma once

namespace lifecycle {

/**
 * @brief Перехват SIGINT/SIGTERM
 *
 * Обработчик только выставляет sig_atomic_t флаг; цикл событий
 * опрашивает stopRequested() таймером и завершается сам.
 */
void installStopSignals();

bool stopRequested();

// Для тестов и повторного запуска
void clearStopRequest();

}  // namespace lifecycle
