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
#include <TouchPio.h>
#ifdef TP_DEBUG
#include <Arduino.h>
#endif

const char* tp_statusText(tp_status_t status) {
  switch (status) {
    case TP_OK:
      return "ok";
    case TP_NO_PULLDOWN:
      return "No pulldown on pin; 1Mohm recommended";
    case TP_NO_STATE_MACHINE:
      return "No free state machine";
    case TP_NO_PROGRAM_SPACE:
      return "No room for the pulse-count program";
    case TP_BAD_PIN:
      return "Pin not usable for touch sensing";
    case TP_BAD_CLOCK:
      return "System clock slower than the PIO program clock";
    case TP_ALREADY_STARTED:
      return "Already started";
    case TP_NOT_STARTED:
      return "Not started";
    case TP_BUSY:
      return "Measurement already in progress";
  }
  return "Unknown status";
}

// TouchPio public member functions

TouchPio::TouchPio(TimingUnit& unit, uint8_t pinNo, uint32_t maxCount) : timingUnit(unit) {
  pinNumber = pinNo;
  this->maxCount = maxCount;
  bufSend = maxCount;
  bufRecv = 0;
}

tp_status_t TouchPio::begin() {
  if (started) {
    return TP_ALREADY_STARTED;
  }

  #ifdef TP_DEBUG
  Serial.print(F("\nStarting sensor with pin number "));
  Serial.print(pinNumber);
  Serial.print(F(", max count "));
  Serial.print(maxCount);
  Serial.println('.');
  #endif

  tp_status_t answer = timingUnit.load(pinNumber, TP_PIO_FREQUENCY);
  if (answer != TP_OK) {
    #ifdef TP_DEBUG
    Serial.print(F("Timing unit load failed: "));
    Serial.println(tp_statusText(answer));
    #endif
    return answer;
  }
  started = true;
  lastValue = TP_NO_READING;

  // Take the baseline. A rejected first sample has nothing to fall back on, so it comes back as TP_NO_READING.
  uint32_t base = TP_NO_READING;
  if (measure(base) != TP_OK || base == TP_NO_READING) {
    #ifdef TP_DEBUG
    Serial.println(F("Baseline saturated. No pulldown on pin?"));
    #endif
    end();
    return TP_NO_PULLDOWN;
  }
  baseValue = base;
  // Don't let a huge maxCount wrap the threshold around to something tiny
  threshold = baseValue < TP_MAX_THRESHOLD - TP_THRESHOLD_OFFSET ? baseValue + TP_THRESHOLD_OFFSET : TP_MAX_THRESHOLD;

  #ifdef TP_DEBUG
  Serial.print(F("Baseline "));
  Serial.print(baseValue);
  Serial.print(F(", threshold "));
  Serial.println(threshold);
  #endif

  return TP_OK;
}

void TouchPio::end() {
  // If we're not in service, there's nothing to do
  if (!started) {
    return;
  }
  timingUnit.unload();
  started = false;
  measState = TP_IDLE;

  #ifdef TP_DEBUG
  Serial.print(F("Stopped sensor with pin number "));
  Serial.println(pinNumber);
  #endif
}

TouchPio::~TouchPio() {
  if (started) {
    end();
  }
}

tp_status_t TouchPio::measure(uint32_t& raw) {
  if (!started) {
    raw = lastValue;
    return TP_NOT_STARTED;
  }
  if (measState != TP_IDLE) {
    raw = lastValue;
    return TP_BUSY;
  }

  // One word out, one word back. Nothing else may talk to the timing unit until the reply is in.
  measState = TP_TRIGGERED;
  bufSend = maxCount;
  timingUnit.send(bufSend);
  measState = TP_AWAITING;
  bufRecv = timingUnit.receive();
  measState = TP_RESOLVED;

  if (bufRecv > maxCount) {
    // Can't be a real count; use the last good one and don't let this one become it
    #ifdef TP_DEBUG
    Serial.print(F("Rejected remaining count "));
    Serial.print(bufRecv);
    Serial.print(F(" on pin "));
    Serial.println(pinNumber);
    #endif
    raw = lastValue;
  } else {
    lastValue = maxCount - bufRecv;
    raw = lastValue;
  }
  measState = TP_IDLE;
  return TP_OK;
}

uint32_t TouchPio::rawValue() {
  uint32_t answer;
  tp_status_t status = measure(answer);
  if (status != TP_OK) {
    // measure() has already substituted the last accepted value
    #ifdef TP_DEBUG
    Serial.print(F("rawValue() on pin "));
    Serial.print(pinNumber);
    Serial.print(F(": "));
    Serial.println(tp_statusText(status));
    #endif
    return lastValue;
  }
  return answer;
}

bool TouchPio::value() {
  return rawValue() > threshold;
}

void TouchPio::setThreshold(uint32_t newThreshold) {
  threshold = newThreshold;
}

uint32_t TouchPio::getThreshold() {
  return threshold;
}

uint32_t TouchPio::getBaseline() {
  return baseValue;
}

uint32_t TouchPio::getLastValue() {
  return lastValue;
}

uint32_t TouchPio::getMaxCount() {
  return maxCount;
}

tp_measState_t TouchPio::getMeasState() {
  return measState;
}

bool TouchPio::isStarted() {
  return started;
}

uint8_t TouchPio::getPin() {
  return pinNumber;
}
