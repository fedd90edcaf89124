/****
 * 
 * This file is a part of the TouchPio library. See README.md for details
 * 
 *****
 * 
 * TouchPio V1.0.0, October 2026
 * Copyright (C) 2026 D.L. Ehnebuske
 * 
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 * 
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 * 
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE. 
 * 
 ****/
#pragma once
#ifndef TimingUnit_h
#define TimingUnit_h
#include <stdint.h>

/**
 * @brief The status codes returned by TouchPio and TimingUnit operations.
 * 
 */
enum tp_status_t : uint8_t {
    TP_OK = 0,              // Success
    TP_NO_PULLDOWN,         // The baseline reading saturated: the pin has no path to ground. Fix the wiring.
    TP_NO_STATE_MACHINE,    // No unused state machine was available to bind to the pin
    TP_NO_PROGRAM_SPACE,    // No room in instruction memory for the pulse-count program
    TP_BAD_PIN,             // The pin can't be used by the timing unit
    TP_BAD_CLOCK,           // The system clock is too slow to run the program at the requested frequency
    TP_ALREADY_STARTED,     // begin() was invoked on a sensor (or load() on a unit) that's already running
    TP_NOT_STARTED,         // A measurement was requested from a sensor that isn't running
    TP_BUSY                 // A measurement was requested while another was still unresolved
};

/**
 * @brief   Short human-readable description of a status code.
 * 
 * @param status        The status to describe
 * @return const char*  The description, a string constant
 */
const char* tp_statusText(tp_status_t status);

/**
 * @brief   The capability a TouchPio needs from whatever runs the pulse-count program.
 * 
 * @details The pulse-count program does one measurement each time it's sent a word: it charges the pin, lets it 
 *          discharge and counts the sent word down once per poll while the pin stays HIGH. It replies with 
 *          what's left of the count, or 0 if the count ran out first. Exactly one reply comes back for each 
 *          word sent, in order.
 * 
 *          PioTimingUnit runs the program on an RP2040 PIO state machine. BusyWaitTimingUnit does the same 
 *          thing with the CPU on boards that have no PIO.
 */
class TimingUnit {
public:
    virtual ~TimingUnit() {}

    /**
     * @brief   Load the pulse-count program and bind it to a pin.
     * 
     * @param pin           The GPIO pin used both as the charge output and as the jump-condition input
     * @param frequency     The clock rate, in Hz, at which the program is to run
     * @return tp_status_t  TP_OK or the reason the program couldn't be loaded
     */
    virtual tp_status_t load(uint8_t pin, uint32_t frequency) = 0;

    /**
     * @brief   Release the pin and whatever resources load() claimed. Does nothing if nothing is loaded.
     * 
     */
    virtual void unload() = 0;

    /**
     * @brief Write one word to the program, blocking until there's room for it.
     * 
     * @param word  The word to send
     */
    virtual void send(uint32_t word) = 0;

    /**
     * @brief Read one word from the program, blocking until one is available.
     * 
     * @return uint32_t The word received
     */
    virtual uint32_t receive() = 0;
};

#endif
