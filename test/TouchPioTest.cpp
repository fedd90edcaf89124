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
#include <gtest/gtest.h>
#include <string>
#include <type_traits>
#include <TouchPio.h>
#include "SimulatedTimingUnit.h"

namespace {

constexpr uint8_t PIN = 2;

static_assert(!std::is_copy_constructible<TouchPio>::value, "TouchPio owns its timing unit binding");
static_assert(!std::is_copy_assignable<TouchPio>::value, "TouchPio owns its timing unit binding");

TEST(TouchPioBegin, ZeroRemainingGivesMaxCountBaseline) {
  SimulatedTimingUnit unit;
  unit.replies = {0};
  TouchPio sensor(unit, PIN);

  ASSERT_EQ(TP_OK, sensor.begin());
  EXPECT_TRUE(sensor.isStarted());
  EXPECT_EQ(TP_DEFAULT_MAX_COUNT, sensor.getBaseline());
  EXPECT_EQ(TP_DEFAULT_MAX_COUNT + TP_THRESHOLD_OFFSET, sensor.getThreshold());
  EXPECT_EQ(TP_DEFAULT_MAX_COUNT, sensor.getLastValue());
}

TEST(TouchPioBegin, BindsPinAtPioFrequencyAndSendsMaxCount) {
  SimulatedTimingUnit unit;
  unit.highPolls = 40;
  TouchPio sensor(unit, PIN, 5000);

  ASSERT_EQ(TP_OK, sensor.begin());
  EXPECT_EQ(1, unit.loads);
  EXPECT_EQ(PIN, unit.loadedPin);
  EXPECT_EQ(TP_PIO_FREQUENCY, unit.loadedFrequency);
  ASSERT_EQ(1u, unit.sent.size());
  EXPECT_EQ(5000u, unit.sent[0]);
  EXPECT_EQ(41u, sensor.getBaseline());
  EXPECT_EQ(241u, sensor.getThreshold());
}

TEST(TouchPioBegin, SaturatedBaselineIsNoPulldown) {
  SimulatedTimingUnit unit;
  unit.replies = {TP_DEFAULT_MAX_COUNT + 1};      // maxCount - remaining would be 0xFFFFFFFF
  TouchPio sensor(unit, PIN);

  EXPECT_EQ(TP_NO_PULLDOWN, sensor.begin());
  EXPECT_FALSE(sensor.isStarted());
  EXPECT_EQ(TP_NO_READING, sensor.getBaseline());
  EXPECT_EQ(TP_NO_READING, sensor.getThreshold());
  EXPECT_EQ(1, unit.unloads);
  EXPECT_FALSE(unit.loaded);
}

TEST(TouchPioBegin, AllOnesReplyIsNoPulldown) {
  SimulatedTimingUnit unit;
  unit.replies = {0xFFFFFFFF};
  TouchPio sensor(unit, PIN);

  EXPECT_EQ(TP_NO_PULLDOWN, sensor.begin());
  EXPECT_EQ(TP_NO_READING, sensor.getThreshold());
}

TEST(TouchPioBegin, LoadFailureIsPassedThrough) {
  SimulatedTimingUnit unit;
  unit.loadStatus = TP_NO_STATE_MACHINE;
  TouchPio sensor(unit, PIN);

  EXPECT_EQ(TP_NO_STATE_MACHINE, sensor.begin());
  EXPECT_FALSE(sensor.isStarted());
  EXPECT_TRUE(unit.sent.empty());
  EXPECT_EQ(0, unit.unloads);

  unit.loadStatus = TP_NO_PROGRAM_SPACE;
  EXPECT_EQ(TP_NO_PROGRAM_SPACE, sensor.begin());
}

TEST(TouchPioBegin, SlowClockIsPassedThrough) {
  SimulatedTimingUnit unit;
  unit.loadStatus = TP_BAD_CLOCK;
  TouchPio sensor(unit, PIN);

  EXPECT_EQ(TP_BAD_CLOCK, sensor.begin());
  EXPECT_FALSE(sensor.isStarted());
  EXPECT_TRUE(unit.sent.empty());
}

TEST(TouchPioBegin, ThresholdIsCappedForHugeMaxCount) {
  SimulatedTimingUnit unit;
  unit.replies = {0, 0};
  TouchPio sensor(unit, PIN, 0xFFFFFFF0);

  ASSERT_EQ(TP_OK, sensor.begin());
  EXPECT_EQ(0xFFFFFFF0u, sensor.getBaseline());
  EXPECT_EQ(TP_MAX_THRESHOLD, sensor.getThreshold());
  EXPECT_FALSE(sensor.value());                   // Untouched pad at the baseline isn't a touch
}

TEST(TouchPioBegin, ThresholdJustBelowCapIsNotCapped) {
  SimulatedTimingUnit unit;
  const uint32_t maxCount = TP_MAX_THRESHOLD - TP_THRESHOLD_OFFSET - 1;
  unit.replies = {0};
  TouchPio sensor(unit, PIN, maxCount);

  ASSERT_EQ(TP_OK, sensor.begin());
  EXPECT_EQ(maxCount + TP_THRESHOLD_OFFSET, sensor.getThreshold());
}

TEST(TouchPioBegin, SecondBeginIsRefused) {
  SimulatedTimingUnit unit;
  TouchPio sensor(unit, PIN);

  ASSERT_EQ(TP_OK, sensor.begin());
  EXPECT_EQ(TP_ALREADY_STARTED, sensor.begin());
  EXPECT_EQ(1, unit.loads);
}

TEST(TouchPioMeasure, RawValueStaysWithinMaxCount) {
  const uint32_t maxCounts[] = {1, 100, TP_DEFAULT_MAX_COUNT};
  for (uint32_t maxCount : maxCounts) {
    SimulatedTimingUnit unit;
    TouchPio sensor(unit, PIN, maxCount);
    ASSERT_EQ(TP_OK, sensor.begin());
    for (uint32_t polls = 0; polls <= maxCount + 50; polls += (maxCount / 20) + 1) {
      unit.highPolls = polls;
      uint32_t raw = sensor.rawValue();
      EXPECT_LE(raw, maxCount) << "maxCount " << maxCount << ", polls " << polls;
      EXPECT_EQ(raw, sensor.getLastValue());
    }
  }
}

TEST(TouchPioMeasure, LongerDischargeGivesBiggerRawValue) {
  SimulatedTimingUnit unit;
  TouchPio sensor(unit, PIN);
  ASSERT_EQ(TP_OK, sensor.begin());

  unit.highPolls = 300;
  uint32_t untouched = sensor.rawValue();
  unit.highPolls = 900;
  uint32_t touched = sensor.rawValue();
  EXPECT_EQ(301u, untouched);
  EXPECT_EQ(901u, touched);

  unit.highPolls = TP_DEFAULT_MAX_COUNT * 2;      // Never discharges
  EXPECT_EQ(TP_DEFAULT_MAX_COUNT, sensor.rawValue());
}

TEST(TouchPioMeasure, CorruptedSampleRepeatsPreviousValue) {
  SimulatedTimingUnit unit;
  unit.replies = {9000, 8000, 20000, 7000};
  TouchPio sensor(unit, PIN);
  ASSERT_EQ(TP_OK, sensor.begin());
  EXPECT_EQ(1000u, sensor.getBaseline());

  EXPECT_EQ(2000u, sensor.rawValue());
  EXPECT_EQ(2000u, sensor.rawValue());            // 20000 > maxCount, rejected
  EXPECT_EQ(2000u, sensor.getLastValue());
  EXPECT_EQ(3000u, sensor.rawValue());
  EXPECT_EQ(3000u, sensor.getLastValue());
}

TEST(TouchPioMeasure, CallerMaxCountIsUsedForSaturationCheck) {
  SimulatedTimingUnit unit;
  unit.replies = {400, 600, 100};
  TouchPio sensor(unit, PIN, 500);
  ASSERT_EQ(TP_OK, sensor.begin());
  EXPECT_EQ(100u, sensor.getBaseline());

  EXPECT_EQ(100u, sensor.rawValue());             // 600 > 500, rejected
  EXPECT_EQ(400u, sensor.rawValue());
  for (uint32_t word : unit.sent) {
    EXPECT_EQ(500u, word);
  }
  EXPECT_EQ(500u, sensor.getMaxCount());
}

TEST(TouchPioMeasure, BackToBackReadingsAreStable) {
  SimulatedTimingUnit unit;
  unit.highPolls = 1234;
  TouchPio sensor(unit, PIN);
  ASSERT_EQ(TP_OK, sensor.begin());

  uint32_t first = sensor.rawValue();
  uint32_t second = sensor.rawValue();
  EXPECT_EQ(first, second);
  EXPECT_LE(first, TP_DEFAULT_MAX_COUNT);
  EXPECT_EQ(TP_IDLE, sensor.getMeasState());
}

TEST(TouchPioMeasure, NotStartedSendsNothing) {
  SimulatedTimingUnit unit;
  TouchPio sensor(unit, PIN);

  uint32_t raw = 0;
  EXPECT_EQ(TP_NOT_STARTED, sensor.measure(raw));
  EXPECT_EQ(TP_NO_READING, raw);
  EXPECT_EQ(TP_NO_READING, sensor.rawValue());
  EXPECT_TRUE(unit.sent.empty());
}

TEST(TouchPioMeasure, OverlappingMeasurementIsBusy) {
  SimulatedTimingUnit unit;
  unit.replies = {9000, 8500};
  TouchPio sensor(unit, PIN);
  ASSERT_EQ(TP_OK, sensor.begin());

  tp_status_t innerStatus = TP_OK;
  uint32_t innerRaw = 0;
  tp_measState_t innerState = TP_IDLE;
  unit.onSend = [&]() {
    innerState = sensor.getMeasState();
    innerStatus = sensor.measure(innerRaw);
  };

  uint32_t raw = 0;
  EXPECT_EQ(TP_OK, sensor.measure(raw));
  EXPECT_EQ(1500u, raw);
  EXPECT_EQ(TP_TRIGGERED, innerState);
  EXPECT_EQ(TP_BUSY, innerStatus);
  EXPECT_EQ(1000u, innerRaw);                     // The value accepted before the outer measurement
  EXPECT_EQ(2u, unit.sent.size());                // Baseline and outer measurement only
  EXPECT_TRUE(unit.pending.empty());
  EXPECT_EQ(TP_IDLE, sensor.getMeasState());
}

TEST(TouchPioValue, ComparesStrictlyAgainstThreshold) {
  SimulatedTimingUnit unit;
  unit.replies = {9000, 8800, 8799};
  TouchPio sensor(unit, PIN);
  ASSERT_EQ(TP_OK, sensor.begin());
  ASSERT_EQ(1200u, sensor.getThreshold());

  EXPECT_FALSE(sensor.value());                   // 1200 is not above 1200
  EXPECT_TRUE(sensor.value());                    // 1201 is
}

TEST(TouchPioValue, ThresholdChangeTakesEffectImmediately) {
  SimulatedTimingUnit unit;
  unit.highPolls = 999;                           // Raw value 1000, steady
  TouchPio sensor(unit, PIN);
  ASSERT_EQ(TP_OK, sensor.begin());
  ASSERT_EQ(1200u, sensor.getThreshold());

  EXPECT_FALSE(sensor.value());
  sensor.setThreshold(999);
  EXPECT_TRUE(sensor.value());
  sensor.setThreshold(1000);
  EXPECT_FALSE(sensor.value());
  EXPECT_EQ(1000u, sensor.getBaseline());         // The baseline doesn't move with the threshold
}

TEST(TouchPioEnd, ReleasesTimingUnitOnce) {
  SimulatedTimingUnit unit;
  {
    TouchPio sensor(unit, PIN);
    ASSERT_EQ(TP_OK, sensor.begin());
    sensor.end();
    sensor.end();
    EXPECT_FALSE(sensor.isStarted());
    EXPECT_EQ(1, unit.unloads);

    uint32_t raw = 0;
    EXPECT_EQ(TP_NOT_STARTED, sensor.measure(raw));

    ASSERT_EQ(TP_OK, sensor.begin());             // Can be started again
  }
  EXPECT_EQ(2, unit.unloads);                     // The destructor released the second binding
  EXPECT_FALSE(unit.loaded);
}

TEST(TouchPioStatus, TextDescribesEachStatus) {
  EXPECT_EQ(std::string("No pulldown on pin; 1Mohm recommended"), tp_statusText(TP_NO_PULLDOWN));
  EXPECT_EQ(std::string("ok"), tp_statusText(TP_OK));
  EXPECT_EQ(std::string("Measurement already in progress"), tp_statusText(TP_BUSY));
  EXPECT_EQ(std::string("System clock slower than the PIO program clock"), tp_statusText(TP_BAD_CLOCK));
}

} // namespace
