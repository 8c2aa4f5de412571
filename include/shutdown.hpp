/**
 * @file shutdown.hpp
 * @brief Termination signal handling shared by the UsbVault jobs.
 *
 * SIGINT, SIGTERM and SIGHUP only raise a flag. Blocking waits in the jobs poll
 * the flag so that locks, child processes and transient files are released by
 * normal scope exit instead of by the signal handler.
 */

#ifndef SHUTDOWN_HPP
#define SHUTDOWN_HPP

#include <chrono>
#include <csignal>
#include <functional>

extern volatile std::sig_atomic_t gShutdownFlag;

/**
 * @brief Installs the flag-raising handler for SIGINT, SIGTERM and SIGHUP.
 *
 * Handlers are installed without SA_RESTART so blocking system calls return
 * early with EINTR.
 */
void installShutdownHandlers();

/**
 * @brief Returns true once a termination signal has been received.
 */
bool shutdownRequested();

/**
 * @brief Sleeps for the given duration in short slices, waking early when interrupted.
 *
 * @param duration Total time to sleep.
 * @param interrupted Polled between slices; shutdownRequested() when empty.
 * @return true if the full duration elapsed, false if interrupted.
 */
bool interruptibleSleep(std::chrono::milliseconds duration, const std::function<bool()>& interrupted = {});

#endif // SHUTDOWN_HPP
