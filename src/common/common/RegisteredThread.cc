/*
 * InfoHud - Copyright (C) 2025 Jacob Wirth & Justin Li
 *
 * This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "RegisteredThread.hh"

#include "common/Common.hh"
#include "common/Defer.hh"
#include "common/Logging.hh"
#include "common/Tracing.hh"

#include <thread>

namespace hud {
    RegisteredThread::RegisteredThread(std::string threadName, chrono_clock::duration interval, bool traceFrames)
        : threadName(threadName), interval(interval), stepCount(0), maxStepCount(0), stepMode(false),
          traceFrames(traceFrames), state(ThreadState::Stopped), measuredFps(0) {}

    RegisteredThread::RegisteredThread(std::string threadName, double framesPerSecond, bool traceFrames)
        : threadName(threadName), interval(0), stepCount(0), maxStepCount(0), stepMode(false),
          traceFrames(traceFrames), state(ThreadState::Stopped), measuredFps(0) {
        if (framesPerSecond > 0.0) {
            interval = std::chrono::nanoseconds((int64_t)(1e9 / framesPerSecond));
        }
    }

    RegisteredThread::~RegisteredThread() {
        StopThread();
        if (thread.joinable()) thread.join();
    }

    void RegisteredThread::StartThread(bool startPaused) {
        ThreadState current = state;
        if (current != ThreadState::Stopped || !state.compare_exchange_strong(current, ThreadState::Started)) {
            Errorf("RegisteredThread %s already started: %s", threadName, current);
            return;
        }
        state.notify_all();

        // A previous run has already exited, but must still be joined before the handle is reused
        if (thread.joinable()) thread.join();

        if (startPaused) this->Pause();

        thread = std::thread([this] {
            tracy::SetThreadName(threadName.c_str());
            Tracef("RegisteredThread Started %s", threadName);
            Defer exit([this] {
                ThreadState current = state;
                if (current == ThreadState::Stopped || !state.compare_exchange_strong(current, ThreadState::Stopped)) {
                    Errorf("RegisteredThread %s state already Stopped", threadName);
                }
                Tracef("Thread stopping: %s", threadName);
                state.notify_all();
                // Release anyone blocked in Step()
                stepCount = maxStepCount.load();
                stepCount.notify_all();
            });

            if (!ThreadInit()) return;

            auto frameEnd = chrono_clock::now();
            auto measureStart = frameEnd;
            uint32_t framesSinceMeasure = 0;
            while (state == ThreadState::Started) {
                if (this->PreFrame()) {
                    if (this->stepMode) {
                        while (stepCount < maxStepCount) {
                            if (traceFrames) FrameMarkStart(threadName.c_str());
                            this->Frame();
                            if (traceFrames) FrameMarkEnd(threadName.c_str());
                            stepCount++;
                            framesSinceMeasure++;
                        }
                        stepCount.notify_all();
                        this->PostFrame(true);
                    } else {
                        if (traceFrames) FrameMarkStart(threadName.c_str());
                        this->Frame();
                        if (traceFrames) FrameMarkEnd(threadName.c_str());
                        framesSinceMeasure++;
                        this->PostFrame(false);
                    }
                }

                auto realFrameEnd = chrono_clock::now();
                if (realFrameEnd - measureStart >= std::chrono::seconds(1)) {
                    measuredFps = framesSinceMeasure;
                    framesSinceMeasure = 0;
                    measureStart = realFrameEnd;
                }

                if (this->interval.count() > 0) {
                    frameEnd += this->interval;

                    if (realFrameEnd >= frameEnd) {
                        // Falling behind, reset target frame end time.
                        frameEnd = realFrameEnd + std::chrono::nanoseconds(100);
                    }

                    std::this_thread::sleep_until(frameEnd);
                } else {
                    std::this_thread::yield();
                }
            }
        });
    }

    void RegisteredThread::Pause(bool pause) {
        stepMode = pause;
    }

    void RegisteredThread::Step(unsigned int count) {
        maxStepCount += count;
        auto step = stepCount.load();
        while (step < maxStepCount && state == ThreadState::Started) {
            stepCount.wait(step);
            step = stepCount.load();
        }
    }

    void RegisteredThread::StopThread(bool waitForExit) {
        ThreadState current = state;
        if (current == ThreadState::Stopped || !state.compare_exchange_strong(current, ThreadState::Stopping)) {
            // Thread already in a stopped state
            return;
        }
        state.notify_all();

        if (waitForExit) {
            current = state;
            while (current != ThreadState::Stopped) {
                state.wait(current);
                current = state;
            }
        }
    }
} // namespace hud
