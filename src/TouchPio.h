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
#ifndef TouchPio_h
#define TouchPio_h
#include <stdint.h>
#include <TimingUnit.h>
#include <PulseCount.h>

constexpr uint32_t TP_DEFAULT_MAX_COUNT     = 10000;        // Default countdown ceiling for one measurement
constexpr uint32_t TP_THRESHOLD_OFFSET      = 200;          // Threshold is set this far above the baseline by begin()
constexpr uint32_t TP_NO_READING            = 0xFFFFFFFF;   // lastValue before any measurement has been accepted
constexpr uint32_t TP_MAX_THRESHOLD         = TP_NO_READING - 1;    // begin() never sets the threshold above this

//#define TP_DEBUG                                        // Uncomment to enable general debug output; comment to disable

/**
 * @brief Where a TouchPio is in its measurement cycle.
 * 
 */
enum tp_measState_t : uint8_t {
    TP_IDLE = 0,    // No measurement in progress
    TP_TRIGGERED,   // maxCount is being sent to the timing unit
    TP_AWAITING,    // Blocked waiting for the timing unit's reply
    TP_RESOLVED     // Reply received, raw value being worked out
};

class TouchPio {
public:
    /**
     * @brief Construct a new TouchPio object. Nothing happens to the hardware until begin() is invoked.
     * 
     * @param unit      The TimingUnit that will run the pulse-count program for this sensor. It mustn't be 
     *                  shared with another TouchPio.
     * @param pinNo     The GPIO pin to which the touch pad is attached. It needs a pull-down (1MOhm works well).
     * @param maxCount  The countdown ceiling for each measurement. Bigger allows larger raw values at the 
     *                  cost of a longer worst-case measurement. Above TP_MAX_THRESHOLD - TP_THRESHOLD_OFFSET 
     *                  the threshold begin() sets is capped at TP_MAX_THRESHOLD instead of sitting 
     *                  TP_THRESHOLD_OFFSET above the baseline.
     */
    TouchPio(TimingUnit& unit, uint8_t pinNo, uint32_t maxCount = TP_DEFAULT_MAX_COUNT);

    /**
     * @brief   Bind the timing unit to the pin, take the baseline measurement and set the threshold.
     * 
     * @details The baseline is taken with the assumption that nobody's touching the pad. The threshold is set 
     *          TP_THRESHOLD_OFFSET above it.
     * 
     *          If the baseline comes back as TP_NO_READING, the pin never discharged in a way that could be 
     *          measured. That's a wiring problem (usually a missing pull-down), not something that will go 
     *          away by trying again, so begin() gives up, releases the timing unit and leaves the threshold 
     *          alone.
     * 
     * @return TP_OK                Sensor is running,
     * @return TP_NO_PULLDOWN       No usable baseline; fix the hardware,
     * @return TP_ALREADY_STARTED   begin() was already successfully invoked,
     * @return others               Whatever the TimingUnit's load() said went wrong.
     */
    tp_status_t begin();

    /**
     * @brief Stop the sensor and release the timing unit. Safe to invoke more than once.
     * 
     */
    void end();

    /**
     * @brief Destroy the TouchPio object, releasing the timing unit if it's still bound.
     * 
     */
    ~TouchPio();

    // A started TouchPio owns its timing unit binding; a copy would release it twice
    TouchPio(const TouchPio&) = delete;
    TouchPio& operator=(const TouchPio&) = delete;

    /**
     * @brief   Do one measurement, making it available through raw.
     * 
     * @details The measurement is a blocking round trip: maxCount goes to the timing unit and the remaining 
     *          count comes back. The raw value is maxCount minus the remaining count, so it's bigger the 
     *          longer the pin took to discharge.
     * 
     *          A remaining count bigger than maxCount can't be a real measurement. In that case raw is set to 
     *          the last accepted value and lastValue is left as it was.
     * 
     *          Only one measurement can be in flight at a time. If measure() is invoked (from an ISR, say) 
     *          while another is unresolved, nothing is sent, raw is set to the last accepted value and 
     *          TP_BUSY is returned. Sending anyway would pair the replies with the wrong requests from then on.
     * 
     * @param raw           Where to put the raw value
     * @return TP_OK        raw holds a measurement (or the substitute for a rejected one),
     * @return TP_BUSY      Another measurement is in progress; raw holds the last accepted value,
     * @return TP_NOT_STARTED   The sensor isn't running; raw holds the last accepted value.
     */
    tp_status_t measure(uint32_t& raw);

    /**
     * @brief   Do one measurement and return its raw value. (See measure().)
     * 
     * @return uint32_t The raw value, in the range [0, maxCount] once a measurement has been accepted.
     */
    uint32_t rawValue();

    /**
     * @brief   Do one measurement and say whether the pad is being touched.
     * 
     * @return true     rawValue() is greater than the threshold,
     * @return false    It isn't.
     */
    bool value();

    /**
     * @brief Set the raw value above which value() reports a touch.
     * 
     * @param newThreshold  The new threshold
     */
    void setThreshold(uint32_t newThreshold);

    /**
     * @brief   Get the raw value above which value() reports a touch.
     * 
     * @return uint32_t The threshold; TP_NO_READING if begin() hasn't succeeded and setThreshold() hasn't 
     *                  been invoked.
     */
    uint32_t getThreshold();

    /**
     * @brief   Get the baseline raw value taken by begin().
     * 
     * @return uint32_t The baseline; TP_NO_READING if begin() hasn't succeeded.
     */
    uint32_t getBaseline();

    /**
     * @brief   Get the most recently accepted raw value.
     * 
     * @return uint32_t The last accepted raw value or TP_NO_READING if there hasn't been one.
     */
    uint32_t getLastValue();

    /**
     * @brief   Get the countdown ceiling sent with every measurement.
     * 
     * @return uint32_t The maxCount given to the constructor
     */
    uint32_t getMaxCount();

    /**
     * @brief   Get where the sensor is in its measurement cycle. Anything other than TP_IDLE means a 
     *          measurement is in flight and measure() will return TP_BUSY.
     * 
     * @return tp_measState_t   The current measurement state
     */
    tp_measState_t getMeasState();

    /**
     * @brief   Whether the sensor is running.
     * 
     * @return true     begin() succeeded and end() hasn't been invoked since,
     * @return false    It isn't running.
     */
    bool isStarted();

    /**
     * @brief           Get the number of the GPIO pin to which this TouchPio is connected.
     * 
     * @return uint8_t  The number of the GPIO pin to which this TouchPio is connected
     */
    uint8_t getPin();

private:
    TimingUnit& timingUnit;                     // What runs the pulse-count program for us
    uint32_t maxCount;                          // Countdown ceiling sent with every measurement
    uint32_t bufSend;                           // The word most recently sent to the timing unit
    uint32_t bufRecv;                           // The word most recently received from the timing unit
    uint32_t baseValue = TP_NO_READING;         // Raw value measured by begin()
    uint32_t lastValue = TP_NO_READING;         // The most recently accepted raw value
    uint32_t threshold = TP_NO_READING;         // value() is true when the raw value is above this
    volatile tp_measState_t measState = TP_IDLE;    // Where we are in the current measurement, if any
    uint8_t pinNumber;                          // The GPIO pin the pad is attached to
    bool started = false;                       // True between a successful begin() and end()
};

#endif
