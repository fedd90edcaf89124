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
#include <BusyWaitTimingUnit.h>

tp_status_t BusyWaitTimingUnit::load(uint8_t pin, uint32_t frequency) {
  (void)frequency;
  if (loaded) {
    return TP_ALREADY_STARTED;
  }
  if (pin >= NUM_DIGITAL_PINS) {
    return TP_BAD_PIN;
  }
  pinNumber = pin;
  pinMode(pinNumber, INPUT);
  loaded = true;
  return TP_OK;
}

void BusyWaitTimingUnit::unload() {
  if (!loaded) {
    return;
  }
  pinMode(pinNumber, INPUT);
  loaded = false;
}

void BusyWaitTimingUnit::send(uint32_t word) {
  // Only the charge interval has to be exact. The countdown runs with interrupts on so millis() and Serial
  // keep working; an interrupt during it just makes that one raw value a little bigger.
  noInterrupts();
  pinMode(pinNumber, OUTPUT);                     // Charge the pad
  digitalWrite(pinNumber, HIGH);
  delayMicroseconds(TP_CHARGE_MICROS);
  pinMode(pinNumber, INPUT);                      // Let it discharge through the pull-down
  interrupts();

  uint8_t pin = pinNumber;
  reply = tp_countDown(word, [pin]() { return digitalRead(pin) == HIGH; });
}

uint32_t BusyWaitTimingUnit::receive() {
  return reply;
}
