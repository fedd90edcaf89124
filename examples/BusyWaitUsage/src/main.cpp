/****
 * @file    main.cpp
 * @author  D. L. Ehnebuske (dle.com@ehnebuske.net)
 * @brief   Example of using TouchPio without a PIO, on any Arduino board
 * @version 1.0.0
 * @date    2026-10-12
 * 
 * The pulse-count program is run by the CPU instead of a PIO state machine. The countdown goes much more slowly 
 * that way, so the max count and the threshold are a lot smaller than with the PIO.
 * 
 ****
 * Copyright (C) 2026 D. L. Ehnebuske
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
#include <Arduino.h>
#include <BusyWaitTimingUnit.h>
#include <TouchPio.h>

constexpr uint8_t SENSOR_PIN = 4;                                   // The GPIO pin the touch pad is on
constexpr uint32_t MAX_COUNT = 2000;                                // Countdown ceiling, in digitalRead()s
constexpr uint32_t THRESHOLD_OFFSET = 10;                           // Touched when this far above baseline
constexpr unsigned long SERIAL_DELAY = 500;                         // The time in millis() to delay to wait for Serial to come up

BusyWaitTimingUnit unit;
TouchPio sensor {unit, SENSOR_PIN, MAX_COUNT};
bool wasTouched = false;

void setup() {
  Serial.begin(9600);
  delay(SERIAL_DELAY);
  pinMode(LED_BUILTIN, OUTPUT);

  tp_status_t status = sensor.begin();
  Serial.print(F("Sensor: "));
  Serial.println(tp_statusText(status));
  if (status == TP_OK) {
    sensor.setThreshold(sensor.getBaseline() + THRESHOLD_OFFSET);
  }
}

void loop() {
  if (!sensor.isStarted()) {
    return;
  }
  bool touched = sensor.value();
  if (touched != wasTouched) {
    digitalWrite(LED_BUILTIN, touched ? HIGH : LOW);
    Serial.println(touched ? F("touched") : F("released"));
    wasTouched = touched;
  }
}
