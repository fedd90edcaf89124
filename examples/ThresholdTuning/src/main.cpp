/****
 * @file    main.cpp
 * @author  D. L. Ehnebuske (dle.com@ehnebuske.net)
 * @brief   Example of tuning the threshold of a TouchPio sensor
 * @version 1.0.0
 * @date    2026-10-12
 * 
 * Watches one sensor and, when the user types '+' or '-' on Serial, raises or lowers its threshold. Typing 'r' 
 * puts the threshold back where begin() put it. Shows the raw value, the threshold and the touched state.
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
#include <PioTimingUnit.h>
#include <TouchPio.h>

constexpr uint8_t SENSOR_PIN = 2;                                   // The GPIO pin the touch pad is on
constexpr uint32_t MAX_COUNT = 20000;                               // Allow for a bigger pad than the default does
constexpr uint32_t STEP = 50;                                       // How much '+' and '-' change the threshold
constexpr unsigned long SERIAL_DELAY = 500;                         // The time in millis() to delay to wait for Serial to come up
constexpr unsigned long DUMP_MILLIS = 100;                          // Sensor dump interval in millis()

PioTimingUnit unit {pio0};
TouchPio sensor {unit, SENSOR_PIN, MAX_COUNT};
bool running = false;

void setup() {
  Serial.begin(115200);
  delay(SERIAL_DELAY);

  tp_status_t status = sensor.begin();
  if (status != TP_OK) {
    Serial.print(F("Sensor didn't start: "));
    Serial.println(tp_statusText(status));
    return;
  }
  running = true;
  Serial.print(F("Baseline "));
  Serial.print(sensor.getBaseline());
  Serial.print(F(", threshold "));
  Serial.println(sensor.getThreshold());
  Serial.println(F("'+' raises the threshold, '-' lowers it, 'r' resets it."));
}

void loop() {
  static unsigned long lastDump = 0;
  if (!running) {
    return;
  }

  while (Serial.available()) {
    uint32_t threshold = sensor.getThreshold();
    switch (Serial.read()) {
      case '+':
        sensor.setThreshold(threshold + STEP);
        break;
      case '-':
        sensor.setThreshold(threshold > STEP ? threshold - STEP : 0);
        break;
      case 'r':
        sensor.setThreshold(sensor.getBaseline() + TP_THRESHOLD_OFFSET);
        break;
      default:
        break;
    }
  }

  if (millis() - lastDump >= DUMP_MILLIS) {
    lastDump = millis();
    uint32_t raw = sensor.rawValue();
    Serial.print(F("raw "));
    Serial.print(raw);
    Serial.print(F(" threshold "));
    Serial.print(sensor.getThreshold());
    Serial.println(raw > sensor.getThreshold() ? F(" touched") : F(""));
  }
}
