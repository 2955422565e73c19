// Copyright (C) 2025, 2026 Maxim [maxirmx] Samsonov (www.sw.consulting)
// All rights reserved.
// This file is a part of twidisplay application

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <memory>
#include <optional>
#include "fake_i2c_bus.h"
#include "peripherals/twi_display.h"

using namespace twidisplay;
using namespace twidisplay::peripherals;
using twidisplay::testing::MockI2cBus;
using twidisplay::testing::RecordingI2cBus;
using ::testing::ElementsAre;
using ::testing::Return;

namespace {

using Bytes = std::vector<uint8_t>;

constexpr uint8_t POS = 0x89;

Bytes slot(uint8_t index, uint8_t value) {
    return Bytes{POS, index, value};
}

} // namespace

class TwiDisplayTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto fake = std::make_unique<RecordingI2cBus>();
        bus = fake.get();
        display = std::make_unique<TwiDisplay>(std::move(fake), TwiDisplay::DEFAULT_ADDRESS);
    }

    std::vector<Bytes> written() const {
        std::vector<Bytes> out;
        for (const auto& t : bus->writes) {
            out.push_back(t.bytes);
        }
        return out;
    }

    RecordingI2cBus* bus = nullptr;
    std::unique_ptr<TwiDisplay> display;
};

TEST_F(TwiDisplayTest, DefaultAddressIs0x12) {
    EXPECT_EQ(TwiDisplay::DEFAULT_ADDRESS, 0x12);
    EXPECT_EQ(display->address(), 0x12);
}

TEST_F(TwiDisplayTest, ConstructionPerformsNoBusTraffic) {
    EXPECT_EQ(bus->attempts, 0u);
    EXPECT_TRUE(bus->reads.empty());
}

TEST_F(TwiDisplayTest, WritesGoToConfiguredAddress) {
    auto fake = std::make_unique<RecordingI2cBus>();
    auto* raw = fake.get();
    TwiDisplay other(std::move(fake), 0x34);

    other.clearDisplay();

    ASSERT_EQ(raw->writes.size(), 1u);
    EXPECT_EQ(raw->writes[0].address, 0x34);
}

TEST_F(TwiDisplayTest, RawWriteSendsBytesAsOneTransaction) {
    display->rawWrite({0x80, 0x10});

    ASSERT_EQ(bus->writes.size(), 1u);
    EXPECT_EQ(bus->writes[0].address, 0x12);
    EXPECT_EQ(bus->writes[0].bytes, (Bytes{0x80, 0x10}));
}

TEST_F(TwiDisplayTest, ClearDisplay) {
    display->clearDisplay();
    EXPECT_EQ(written(), (std::vector<Bytes>{{0x82}}));
}

TEST_F(TwiDisplayTest, ClearTwiceIssuesIdenticalWrites) {
    display->clearDisplay();
    display->clearDisplay();
    EXPECT_EQ(written(), (std::vector<Bytes>{{0x82}, {0x82}}));
}

TEST_F(TwiDisplayTest, DisplayAddress) {
    display->displayAddress();
    EXPECT_EQ(written(), (std::vector<Bytes>{{0x90}}));
}

TEST_F(TwiDisplayTest, SetBrightnessAcceptsFullByteRange) {
    display->setBrightness(0);
    display->setBrightness(127);
    display->setBrightness(255);
    EXPECT_EQ(written(), (std::vector<Bytes>{{0x80, 0}, {0x80, 127}, {0x80, 255}}));
}

TEST_F(TwiDisplayTest, SetMode) {
    display->setMode(Mode::Rotate);
    display->setMode(Mode::Scroll);
    EXPECT_EQ(written(), (std::vector<Bytes>{{0x83, 0}, {0x83, 1}}));
}

TEST_F(TwiDisplayTest, SetDots) {
    display->setDots(0x04);
    EXPECT_EQ(written(), (std::vector<Bytes>{{0x85, 0x04}}));
}

TEST_F(TwiDisplayTest, SendDigitWritesBareByte) {
    display->sendDigit(7);
    EXPECT_EQ(written(), (std::vector<Bytes>{{7}}));
}

TEST_F(TwiDisplayTest, SendDigitRejectsValuesAboveNine) {
    EXPECT_THROW(display->sendDigit(10), InvalidInputError);
    EXPECT_THROW(display->sendDigit(255), InvalidInputError);
    EXPECT_EQ(bus->attempts, 0u);
}

TEST_F(TwiDisplayTest, DisplayDigitMapsPositionToSlot) {
    display->displayDigit(1, 5);
    display->displayDigit(4, 9);
    EXPECT_EQ(written(), (std::vector<Bytes>{slot(0, 5), slot(3, 9)}));
}

TEST_F(TwiDisplayTest, DisplayDigitRejectsInvalidInputWithoutBusAccess) {
    EXPECT_THROW(display->displayDigit(0, 1), InvalidInputError);
    EXPECT_THROW(display->displayDigit(5, 1), InvalidInputError);
    EXPECT_THROW(display->displayDigit(255, 1), InvalidInputError);
    EXPECT_THROW(display->displayDigit(1, 10), InvalidInputError);
    EXPECT_THROW(display->displayDigit(2, 200), InvalidInputError);
    EXPECT_EQ(bus->attempts, 0u);
}

TEST_F(TwiDisplayTest, DisplayNumberWritesFourDigits) {
    display->displayNumber(1234);
    EXPECT_EQ(written(), (std::vector<Bytes>{slot(0, 1), slot(1, 2), slot(2, 3), slot(3, 4)}));
}

TEST_F(TwiDisplayTest, DisplayNumberKeepsLeadingZeros) {
    display->displayNumber(42);
    EXPECT_EQ(written(), (std::vector<Bytes>{slot(0, 0), slot(1, 0), slot(2, 4), slot(3, 2)}));
}

TEST_F(TwiDisplayTest, DisplayNumberDigitDecomposition) {
    for (uint16_t n : {0, 7, 10, 305, 1000, 4096, 9009, 9999}) {
        bus->writes.clear();
        display->displayNumber(n);
        EXPECT_EQ(written(), (std::vector<Bytes>{
                                 slot(0, static_cast<uint8_t>(n / 1000)),
                                 slot(1, static_cast<uint8_t>((n / 100) % 10)),
                                 slot(2, static_cast<uint8_t>((n / 10) % 10)),
                                 slot(3, static_cast<uint8_t>(n % 10))}))
            << "n = " << n;
    }
}

TEST_F(TwiDisplayTest, DisplayNumberRejectsAbove9999) {
    EXPECT_THROW(display->displayNumber(10000), InvalidInputError);
    EXPECT_THROW(display->displayNumber(65535), InvalidInputError);
    EXPECT_EQ(bus->attempts, 0u);
}

TEST_F(TwiDisplayTest, TemperatureBelowRangeShowsLo) {
    for (int16_t t : {-100, -128, -1000}) {
        bus->writes.clear();
        display->displayTemperature(t, TempUnit::Celsius);
        EXPECT_EQ(written(), (std::vector<Bytes>{slot(0, '-'), slot(1, 'L'), slot(2, 'O'), slot(3, '-')}))
            << "t = " << t;
    }
}

TEST_F(TwiDisplayTest, TemperatureAboveRangeShowsHi) {
    for (int16_t t : {100, 127, 500}) {
        bus->writes.clear();
        display->displayTemperature(t, TempUnit::Fahrenheit);
        EXPECT_EQ(written(), (std::vector<Bytes>{slot(0, '-'), slot(1, 'H'), slot(2, 'I'), slot(3, '-')}))
            << "t = " << t;
    }
}

TEST_F(TwiDisplayTest, TemperatureSingleDigitBlanksTens) {
    display->displayTemperature(5, TempUnit::Celsius);
    EXPECT_EQ(written(), (std::vector<Bytes>{slot(0, ' '), slot(1, ' '), slot(2, 5), slot(3, 'C')}));
}

TEST_F(TwiDisplayTest, TemperatureNegativeTwoDigits) {
    display->displayTemperature(-23, TempUnit::Fahrenheit);
    EXPECT_EQ(written(), (std::vector<Bytes>{slot(0, '-'), slot(1, 2), slot(2, 3), slot(3, 'F')}));
}

TEST_F(TwiDisplayTest, TemperatureZeroKeepsUnitsDigit) {
    display->displayTemperature(0, TempUnit::Celsius);
    EXPECT_EQ(written(), (std::vector<Bytes>{slot(0, ' '), slot(1, ' '), slot(2, 0), slot(3, 'C')}));
}

TEST_F(TwiDisplayTest, TemperatureRangeBoundaries) {
    display->displayTemperature(99, TempUnit::Celsius);
    display->displayTemperature(-99, TempUnit::Celsius);
    display->displayTemperature(-7, TempUnit::Celsius);
    display->displayTemperature(10, TempUnit::Fahrenheit);
    EXPECT_EQ(written(), (std::vector<Bytes>{
                             slot(0, ' '), slot(1, 9), slot(2, 9), slot(3, 'C'),
                             slot(0, '-'), slot(1, 9), slot(2, 9), slot(3, 'C'),
                             slot(0, '-'), slot(1, ' '), slot(2, 7), slot(3, 'C'),
                             slot(0, ' '), slot(1, 1), slot(2, 0), slot(3, 'F')}));
}

TEST_F(TwiDisplayTest, HumidityFormatting) {
    display->displayHumidity(100);
    display->displayHumidity(45);
    display->displayHumidity(5);
    display->displayHumidity(0);
    EXPECT_EQ(written(), (std::vector<Bytes>{
                             slot(0, 1), slot(1, 0), slot(2, 0), slot(3, 'H'),
                             slot(0, ' '), slot(1, 4), slot(2, 5), slot(3, 'H'),
                             slot(0, ' '), slot(1, ' '), slot(2, 5), slot(3, 'H'),
                             slot(0, ' '), slot(1, ' '), slot(2, 0), slot(3, 'H')}));
}

TEST_F(TwiDisplayTest, HumidityOutOfRangeSentinels) {
    display->displayHumidity(-1);
    display->displayHumidity(101);
    EXPECT_EQ(written(), (std::vector<Bytes>{
                             slot(0, '-'), slot(1, 'L'), slot(2, 'O'), slot(3, '-'),
                             slot(0, '-'), slot(1, 'H'), slot(2, 'I'), slot(3, '-')}));
}

TEST_F(TwiDisplayTest, SetAddressKeepsClientAddress) {
    display->setAddress(0x20);
    display->clearDisplay();

    ASSERT_EQ(bus->writes.size(), 2u);
    EXPECT_EQ(bus->writes[0].bytes, (Bytes{0x81, 0x20}));
    EXPECT_EQ(bus->writes[1].address, 0x12);
    EXPECT_EQ(display->address(), 0x12);
}

TEST_F(TwiDisplayTest, SetAddressRejectsEightBitValues) {
    EXPECT_THROW(display->setAddress(0x80), InvalidInputError);
    EXPECT_EQ(bus->attempts, 0u);
    EXPECT_NO_THROW(display->setAddress(0x7F));
}

TEST_F(TwiDisplayTest, CharactersAndText) {
    display->sendChar('A');
    display->displayChar(2, 'b');
    display->sendText("Hi!");
    EXPECT_EQ(written(), (std::vector<Bytes>{{'A'}, slot(1, 'b'), {'H'}, {'i'}, {'!'}}));
}

TEST_F(TwiDisplayTest, DisplayCharRejectsBadPosition) {
    EXPECT_THROW(display->displayChar(0, 'x'), InvalidInputError);
    EXPECT_THROW(display->displayChar(5, 'x'), InvalidInputError);
    EXPECT_EQ(bus->attempts, 0u);
}

TEST_F(TwiDisplayTest, SendTextEmptyWritesNothing) {
    display->sendText("");
    EXPECT_EQ(bus->attempts, 0u);
}

TEST_F(TwiDisplayTest, DisplayTimeWithDot) {
    display->displayTime(12, 34, true);
    EXPECT_EQ(written(), (std::vector<Bytes>{slot(0, 1), slot(1, 2), slot(2, 3), slot(3, 4), {0x85, 0x04}}));
}

TEST_F(TwiDisplayTest, DisplayTimeWithoutDot) {
    display->displayTime(7, 5, false);
    EXPECT_EQ(written(), (std::vector<Bytes>{slot(0, 0), slot(1, 7), slot(2, 0), slot(3, 5), {0x85, 0x00}}));
}

TEST_F(TwiDisplayTest, DisplayTimeRejectsInvalidTime) {
    EXPECT_THROW(display->displayTime(24, 0, false), InvalidInputError);
    EXPECT_THROW(display->displayTime(12, 60, true), InvalidInputError);
    EXPECT_EQ(bus->attempts, 0u);
}

TEST_F(TwiDisplayTest, DestroyReturnsOwnedBus) {
    auto released = TwiDisplay::destroy(std::move(*display));
    EXPECT_EQ(released.get(), bus);

    // The moved-from client no longer owns a bus
    EXPECT_THROW(display->clearDisplay(), std::logic_error);
}

TEST_F(TwiDisplayTest, DestroyedBusRemainsUsable) {
    display->clearDisplay();
    auto released = TwiDisplay::destroy(std::move(*display));
    ASSERT_NE(released, nullptr);

    TwiDisplay again(std::move(released), 0x12);
    again.clearDisplay();
    EXPECT_EQ(bus->writes.size(), 2u);
}

TEST(TwiDisplayReadTest, FirmwareRevisionUsesWriteRead) {
    auto mock = std::make_unique<MockI2cBus>();
    EXPECT_CALL(*mock, writeRead(0x12, ElementsAre(0x8A), 1u))
        .WillOnce(Return(std::vector<uint8_t>{1}));
    EXPECT_CALL(*mock, write(::testing::_, ::testing::_)).Times(0);

    TwiDisplay display(std::move(mock), TwiDisplay::DEFAULT_ADDRESS);
    EXPECT_EQ(display.getFirmwareRevision(), 1);
}

TEST(TwiDisplayReadTest, DigitCountUsesWriteRead) {
    auto mock = std::make_unique<MockI2cBus>();
    EXPECT_CALL(*mock, writeRead(0x12, ElementsAre(0x8B), 1u))
        .WillOnce(Return(std::vector<uint8_t>{4}));

    TwiDisplay display(std::move(mock), TwiDisplay::DEFAULT_ADDRESS);
    EXPECT_EQ(display.getDigitCount(), 4);
}

TEST(TwiDisplayMockTest, BrightnessFrameThroughMock) {
    auto mock = std::make_unique<MockI2cBus>();
    EXPECT_CALL(*mock, write(0x12, ElementsAre(0x80, 0x7F))).Times(1);

    TwiDisplay display(std::move(mock), TwiDisplay::DEFAULT_ADDRESS);
    display.setBrightness(0x7F);
}

TEST_F(TwiDisplayTest, SendCharRejectsOpcodeRangeBytes) {
    EXPECT_THROW(display->sendChar(static_cast<char>(0x89)), InvalidInputError);
    EXPECT_THROW(display->sendChar(static_cast<char>(0x80)), InvalidInputError);
    EXPECT_THROW(display->sendChar(static_cast<char>(0xFF)), InvalidInputError);
    EXPECT_EQ(bus->attempts, 0u);

    display->sendChar(0x7F);
    EXPECT_EQ(written(), (std::vector<Bytes>{{0x7F}}));
}

TEST_F(TwiDisplayTest, SendTextWithOpcodeByteSendsNothing) {
    EXPECT_THROW(display->sendText("a\x82"), InvalidInputError);
    EXPECT_THROW(display->sendText("\x89\x01\x02"), InvalidInputError);
    EXPECT_EQ(bus->attempts, 0u);
}

TEST_F(TwiDisplayTest, DisplayCharAcceptsAnyByteAsPositionValue) {
    display->displayChar(1, static_cast<char>(0x89));
    EXPECT_EQ(written(), (std::vector<Bytes>{slot(0, 0x89)}));
}

TEST_F(TwiDisplayTest, TemperatureThresholdsNarrowTheBand) {
    display->displayTemperature(-25, TempUnit::Celsius, -20, 50);
    display->displayTemperature(51, TempUnit::Celsius, -20, 50);
    display->displayTemperature(50, TempUnit::Celsius, -20, 50);
    EXPECT_EQ(written(), (std::vector<Bytes>{
                             slot(0, '-'), slot(1, 'L'), slot(2, 'O'), slot(3, '-'),
                             slot(0, '-'), slot(1, 'H'), slot(2, 'I'), slot(3, '-'),
                             slot(0, ' '), slot(1, 5), slot(2, 0), slot(3, 'C')}));
}

TEST_F(TwiDisplayTest, TemperatureThresholdsAreClampedToRange) {
    // A threshold beyond the range cannot make 100 displayable
    display->displayTemperature(100, TempUnit::Fahrenheit, std::nullopt, 500);
    display->displayTemperature(-100, TempUnit::Fahrenheit, -500, std::nullopt);
    EXPECT_EQ(written(), (std::vector<Bytes>{
                             slot(0, '-'), slot(1, 'H'), slot(2, 'I'), slot(3, '-'),
                             slot(0, '-'), slot(1, 'L'), slot(2, 'O'), slot(3, '-')}));
}

TEST_F(TwiDisplayTest, TemperatureWithoutThresholdsMatchesPlainCall) {
    display->displayTemperature(-23, TempUnit::Fahrenheit, std::nullopt, std::nullopt);
    EXPECT_EQ(written(), (std::vector<Bytes>{slot(0, '-'), slot(1, 2), slot(2, 3), slot(3, 'F')}));
}

TEST_F(TwiDisplayTest, HumidityThresholds) {
    display->displayHumidity(20, 30, 70);
    display->displayHumidity(80, 30, 70);
    EXPECT_EQ(written(), (std::vector<Bytes>{
                             slot(0, '-'), slot(1, 'L'), slot(2, 'O'), slot(3, '-'),
                             slot(0, '-'), slot(1, 'H'), slot(2, 'I'), slot(3, '-')}));
}

TEST_F(TwiDisplayTest, InvertedThresholdsAreRejected) {
    EXPECT_THROW(display->displayTemperature(10, TempUnit::Celsius, 40, 20), InvalidInputError);
    EXPECT_THROW(display->displayHumidity(10, 90, 10), InvalidInputError);
    EXPECT_EQ(bus->attempts, 0u);
}
