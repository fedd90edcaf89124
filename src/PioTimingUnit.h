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
#ifndef PioTimingUnit_h
#define PioTimingUnit_h
#include <stdint.h>
#include <hardware/pio.h>
#include <TimingUnit.h>

/**
 * @brief   A TimingUnit that runs the pulse-count program on one state machine of an RP2040 PIO block.
 * 
 * @details Each PioTimingUnit claims its own state machine when it's loaded, so one PIO block can serve up to 
 *          four sensors. They all share a single copy of the program in the block's instruction memory; the 
 *          copy is added by the first load() on the block and removed by the last unload().
 */
class PioTimingUnit : public TimingUnit {
public:
    /**
     * @brief Construct a new PioTimingUnit object.
     * 
     * @param pioBlock  The PIO block (pio0 or pio1) whose state machines are to be used
     */
    PioTimingUnit(PIO pioBlock);

    ~PioTimingUnit();

    // A loaded unit owns its state machine; a copy would release it twice
    PioTimingUnit(const PioTimingUnit&) = delete;
    PioTimingUnit& operator=(const PioTimingUnit&) = delete;

    tp_status_t load(uint8_t pin, uint32_t frequency) override;
    void unload() override;
    void send(uint32_t word) override;
    uint32_t receive() override;

    /**
     * @brief   Get the state machine claimed by load().
     * 
     * @return int  The state machine number or -1 if nothing is loaded
     */
    int getStateMachine();

private:
    PIO pio;                // The PIO block we use
    int sm = -1;            // The state machine we've claimed, or -1 if none
    uint8_t pinNumber = 0;  // The GPIO pin the program is bound to
};

#endif
