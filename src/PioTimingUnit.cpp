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
#include <PioTimingUnit.h>
#include <PulseCount.h>
#include <hardware/clocks.h>
#include <hardware/gpio.h>

namespace tp_pio {

  /**
   * The pulse-count program. One run per word pulled from the TX FIFO:
   * 
   *      pull block              ; wait for maxCount
   *      set pindirs, 1          ; pin to output
   *      set pins, 1 [31]        ; drive it HIGH to charge the pad
   *      set x, 31 [27]
   *  charge:
   *      jmp x--, charge [31]    ; the rest of the TP_CHARGE_CYCLES charge interval
   *      mov x, osr              ; x = maxCount
   *      set pindirs, 0          ; pin to input; the pad discharges through the pull-down
   *  timing:
   *      jmp x--, test           ; count one poll
   *      set x, 0                ; ran out: report nothing remaining
   *      jmp done
   *  test:
   *      jmp pin, timing         ; keep counting while the pin is HIGH
   *  done:
   *      mov isr, x
   *      push block              ; reply with what's left of the count
   * 
   * Jump targets are relative to the start of the program; pio_add_program() relocates them.
   */
  constexpr uint CHARGE = 4;                                        // Address of label "charge"
  constexpr uint TIMING = 7;                                        // Address of label "timing"
  constexpr uint TEST = 10;                                         // Address of label "test"
  constexpr uint DONE = 11;                                         // Address of label "done"

  static uint16_t instructions[TP_PULSE_COUNT_LENGTH];              // The assembled program
  static pio_program_t program = {};                                // The program as the SDK wants to see it
  static bool assembled = false;                                    // Set true once instructions[] is filled in
  static uint programOffset[NUM_PIOS] = {0};                        // Where the program lives in each PIO block
  static uint8_t programUsers[NUM_PIOS] = {0};                      // Number of loaded units using each block's copy

/**
 * @brief Fill in instructions[] and program. Only does the work the first time it's invoked.
 * 
 */
static void assemble() {
  if (assembled) {
    return;
  }
  uint ix = 0;
  instructions[ix++] = pio_encode_pull(false, true);
  instructions[ix++] = pio_encode_set(pio_pindirs, 1);
  instructions[ix++] = pio_encode_set(pio_pins, 1) | pio_encode_delay(TP_CHARGE_HIGH_DELAY);
  instructions[ix++] = pio_encode_set(pio_x, TP_CHARGE_LOOPS) | pio_encode_delay(TP_CHARGE_SETX_DELAY);
  instructions[ix++] = pio_encode_jmp_x_dec(CHARGE) | pio_encode_delay(TP_CHARGE_LOOP_DELAY);
  instructions[ix++] = pio_encode_mov(pio_x, pio_osr);
  instructions[ix++] = pio_encode_set(pio_pindirs, 0);
  instructions[ix++] = pio_encode_jmp_x_dec(TEST);
  instructions[ix++] = pio_encode_set(pio_x, 0);
  instructions[ix++] = pio_encode_jmp(DONE);
  instructions[ix++] = pio_encode_jmp_pin(TIMING);
  instructions[ix++] = pio_encode_mov(pio_isr, pio_x);
  instructions[ix++] = pio_encode_push(false, true);

  program.instructions = instructions;
  program.length = TP_PULSE_COUNT_LENGTH;
  program.origin = -1;
  assembled = true;
}

} // namespace tp_pio

// PioTimingUnit public member functions

PioTimingUnit::PioTimingUnit(PIO pioBlock) {
  pio = pioBlock;
}

PioTimingUnit::~PioTimingUnit() {
  unload();
}

tp_status_t PioTimingUnit::load(uint8_t pin, uint32_t frequency) {
  if (sm >= 0) {
    return TP_ALREADY_STARTED;
  }
  if (pin >= NUM_BANK0_GPIOS) {
    return TP_BAD_PIN;
  }
  uint32_t sysHz = clock_get_hz(clk_sys);
  if (!tp_clockDividerValid(sysHz, frequency)) {
    return TP_BAD_CLOCK;
  }
  tp_pio::assemble();

  uint pioIx = pio_get_index(pio);
  if (tp_pio::programUsers[pioIx] == 0 && !pio_can_add_program(pio, &tp_pio::program)) {
    return TP_NO_PROGRAM_SPACE;
  }
  int claimed = pio_claim_unused_sm(pio, false);
  if (claimed < 0) {
    return TP_NO_STATE_MACHINE;
  }
  if (tp_pio::programUsers[pioIx] == 0) {
    tp_pio::programOffset[pioIx] = pio_add_program(pio, &tp_pio::program);
  }
  tp_pio::programUsers[pioIx]++;
  sm = claimed;
  pinNumber = pin;
  uint offset = tp_pio::programOffset[pioIx];

  // The pin is both what "set" drives and what "jmp pin" tests. Start it off as an input.
  pio_gpio_init(pio, pinNumber);
  pio_sm_set_consecutive_pindirs(pio, sm, pinNumber, 1, false);
  pio_sm_config c = pio_get_default_sm_config();
  sm_config_set_wrap(&c, offset, offset + TP_PULSE_COUNT_LENGTH - 1);
  sm_config_set_set_pins(&c, pinNumber, 1);
  sm_config_set_jmp_pin(&c, pinNumber);
  sm_config_set_clkdiv(&c, static_cast<float>(sysHz) / static_cast<float>(frequency));
  pio_sm_init(pio, sm, offset, &c);
  pio_sm_set_enabled(pio, sm, true);

  return TP_OK;
}

void PioTimingUnit::unload() {
  if (sm < 0) {
    return;
  }
  pio_sm_set_enabled(pio, sm, false);
  pio_sm_clear_fifos(pio, sm);
  pio_sm_set_consecutive_pindirs(pio, sm, pinNumber, 1, false);
  pio_sm_unclaim(pio, sm);
  gpio_deinit(pinNumber);                                           // Hand the pin back to SIO as an input

  uint pioIx = pio_get_index(pio);
  if (--tp_pio::programUsers[pioIx] == 0) {
    pio_remove_program(pio, &tp_pio::program, tp_pio::programOffset[pioIx]);
  }
  sm = -1;
}

void PioTimingUnit::send(uint32_t word) {
  pio_sm_put_blocking(pio, sm, word);
}

uint32_t PioTimingUnit::receive() {
  return pio_sm_get_blocking(pio, sm);
}

int PioTimingUnit::getStateMachine() {
  return sm;
}
