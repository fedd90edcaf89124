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
#ifndef BusyWaitTimingUnit_h
#define BusyWaitTimingUnit_h
#ifndef Arduino_h
    #include <Arduino.h>                                // Arduino goop
#endif
#include <TimingUnit.h>
#include <PulseCount.h>

constexpr unsigned int TP_CHARGE_MICROS = (TP_CHARGE_NANOS + 999) / 1000;   // Charge interval rounded up to micros()

/**
 * @brief   A TimingUnit that does the pulse-count program's work with the CPU, for boards without a PIO.
 * 
 * @details The measurement happens during send(), with interrupts off only while the pad is charged; 
 *          receive() hands back the result. The charge 
 *          interval is the same as the PIO program's, rounded up to a whole microsecond. The countdown goes 
 *          down by one per digitalRead() of the pin, so raw values are much smaller than the PIO's for the same 
 *          pad and the frequency passed to load() has no effect. Choose maxCount and thresholds accordingly.
 */
class BusyWaitTimingUnit : public TimingUnit {
public:
    BusyWaitTimingUnit() = default;
    BusyWaitTimingUnit(const BusyWaitTimingUnit&) = delete;
    BusyWaitTimingUnit& operator=(const BusyWaitTimingUnit&) = delete;

    tp_status_t load(uint8_t pin, uint32_t frequency) override;
    void unload() override;
    void send(uint32_t word) override;
    uint32_t receive() override;

private:
    uint32_t reply = 0;         // The remaining count from the most recent measurement
    uint8_t pinNumber = 0;      // The GPIO pin the pad is attached to
    bool loaded = false;        // True between load() and unload()
};

#endif
