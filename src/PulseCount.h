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
#ifndef PulseCount_h
#define PulseCount_h
#include <stdint.h>

/**
 * Timing constants for the pulse-count program. They are all in PIO clock cycles at TP_PIO_FREQUENCY.
 * 
 * The pin is charged from the moment "set pins, 1" executes until "set pindirs, 0" executes. In between are
 * the two padded instructions, the charge loop ("jmp x--" with a delay, run TP_CHARGE_LOOPS + 1 times) and
 * the "mov x, osr" that loads the countdown ceiling. With the values below that comes to 1085 cycles, i.e.,
 * 8.68us at 125MHz, which is long enough to fully charge a pad with a 1MOhm pull-down.
 */
constexpr uint32_t TP_PIO_FREQUENCY         = 125000000UL;  // The state machine clock rate the timings assume
constexpr uint8_t  TP_CHARGE_HIGH_DELAY     = 31;           // Delay on "set pins, 1"
constexpr uint8_t  TP_CHARGE_SETX_DELAY     = 27;           // Delay on "set x, TP_CHARGE_LOOPS"
constexpr uint8_t  TP_CHARGE_LOOPS          = 31;           // Initial x for the charge loop (5-bit SET operand)
constexpr uint8_t  TP_CHARGE_LOOP_DELAY     = 31;           // Delay on each "jmp x--" of the charge loop
constexpr uint32_t TP_CHARGE_CYCLES =
    (1UL + TP_CHARGE_HIGH_DELAY) +
    (1UL + TP_CHARGE_SETX_DELAY) +
    (TP_CHARGE_LOOPS + 1UL) * (1UL + TP_CHARGE_LOOP_DELAY) +
    1UL;                                                    // The "mov x, osr"
constexpr uint32_t TP_CHARGE_NANOS = 
    static_cast<uint32_t>((TP_CHARGE_CYCLES * 1000000000ULL) / TP_PIO_FREQUENCY);  // The charge interval in nanoseconds

constexpr uint8_t  TP_PULSE_COUNT_LENGTH    = 13;           // Number of instructions in the pulse-count program

static_assert(TP_CHARGE_CYCLES == 1085, "Charge interval is calibrated to 1085 cycles at 125MHz");
static_assert(TP_CHARGE_HIGH_DELAY < 32 && TP_CHARGE_SETX_DELAY < 32 && TP_CHARGE_LOOP_DELAY < 32, 
    "PIO delays are five bits");

/**
 * @brief   Whether a state machine clocked from sysHz can be slowed down to run at frequency. The PIO clock 
 *          divider can't be less than 1, so the system clock has to be at least as fast as the program clock.
 * 
 */
constexpr bool tp_clockDividerValid(uint32_t sysHz, uint32_t frequency) {
    return frequency != 0 && sysHz >= frequency;
}

/**
 * @brief   The countdown half of the pulse-count program, for timing units that do it with the CPU.
 * 
 * @details Mirrors the PIO loop exactly: each pass decrements x and then tests the pin, so a pin that reads 
 *          LOW on the first poll leaves maxCount - 1. If x is already 0 at the top of a pass the count has run 
 *          out and 0 is returned.
 * 
 * @param maxCount  The countdown ceiling
 * @param pinHigh   Callable returning true while the pin still reads HIGH; invoked once per poll
 * @return uint32_t What's left of the count
 */
template <typename PinHigh>
inline uint32_t tp_countDown(uint32_t maxCount, PinHigh pinHigh) {
    uint32_t x = maxCount;
    for (;;) {
        if (x == 0) {                               // Ran out: report nothing remaining
            return 0;
        }
        x--;
        if (!pinHigh()) {                           // Discharged
            return x;
        }
    }
}

#endif
