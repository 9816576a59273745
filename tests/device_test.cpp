// ANOD-Prod headers
#include "core/Errors.hpp"
#include "core/PowerSupply.hpp"
#include "core/Protection.hpp"
#include "core/RegisterClient.hpp"
#include "core/RegisterMap.hpp"

// ANOD-Fake headers
#include "FakeRegisterDevice.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <cmath>
#include <limits>

namespace anod::test {

  using core::Access;
  using core::PowerSupply;
  using core::ProtectionFlag;
  using core::Quantity;
  using core::RegisterClient;
  using core::RegisterMap;

  class PowerSupplyTest : public ::testing::Test {
  protected:
    void SetUp() override {
      auto fake = std::make_unique<FakeRegisterDevice>();
      device = fake.get();
      core::ClientOptions options;
      options.timeout = std::chrono::milliseconds{ 20 };
      client = std::make_shared<RegisterClient>(std::move(fake), options);
      supply = std::make_unique<PowerSupply>(client, RegisterMap::defaults());
    }

    FakeRegisterDevice* device{ nullptr };
    std::shared_ptr<RegisterClient> client;
    std::unique_ptr<PowerSupply> supply;
  };

  TEST_F(PowerSupplyTest, setpoint_round_trips_within_one_count) {
    for (double v : { 0.0, 0.004, 1.25, 12.345, 99.99, 100.0 }) {
      supply->set(Quantity::VoltageSetpoint, v);
      EXPECT_NEAR(v, supply->get(Quantity::VoltageSetpoint), 1.0 / 100.0) << v;
    }
    supply->set(Quantity::CurrentSetpoint, 2.5);
    EXPECT_EQ(2500, device->registerValue(0x0031));
  }

  TEST_F(PowerSupplyTest, measured_values_are_scaled) {
    device->setRegister(0x0010, 1234); // 12.34 V
    device->setRegister(0x0011, 567);  // 0.567 A
    EXPECT_DOUBLE_EQ(12.34, supply->get(Quantity::MeasuredVoltage));
    EXPECT_DOUBLE_EQ(0.567, supply->get(Quantity::MeasuredCurrent));
  }

  TEST_F(PowerSupplyTest, two_register_quantities_are_high_word_first) {
    device->setRegister(0x0012, 0x0001);
    device->setRegister(0x0013, 0x86A0); // 100000 raw
    EXPECT_DOUBLE_EQ(1000.0, supply->get(Quantity::MeasuredPower));

    supply->set(Quantity::OverPowerLimit, 1500.0); // 150000 raw
    EXPECT_EQ(0x0002, device->registerValue(0x0022));
    EXPECT_EQ(0x49F0, device->registerValue(0x0023));
  }

  TEST_F(PowerSupplyTest, out_of_range_write_fails_before_any_traffic) {
    EXPECT_THROW(supply->set(Quantity::VoltageSetpoint, 100.5), core::ValidationError);
    EXPECT_THROW(supply->set(Quantity::VoltageSetpoint, -0.01), core::ValidationError);
    EXPECT_THROW(supply->set(Quantity::VoltageSetpoint, std::nan("")), core::ValidationError);
    EXPECT_THROW(supply->set(Quantity::VoltageSetpoint, std::numeric_limits<double>::infinity()),
                 core::ValidationError);
    EXPECT_THROW(supply->set(Quantity::MeasuredVoltage, 1.0), core::ValidationError);
    EXPECT_EQ(0, device->requests());
  }

  TEST_F(PowerSupplyTest, protection_bits_decode_to_flags) {
    EXPECT_TRUE(supply->readProtectionFlags().empty());

    device->trip(0x01 | 0x04);
    const auto flags = supply->readProtectionFlags();
    EXPECT_EQ((core::ProtectionFlags{ ProtectionFlag::OverVoltage, ProtectionFlag::OverPower }),
              flags);
    EXPECT_EQ("OVP|OPP", core::toString(flags));
  }

  TEST_F(PowerSupplyTest, output_enable_and_identity) {
    supply->setOutputEnabled(true);
    EXPECT_TRUE(supply->outputEnabled());
    supply->setOutputEnabled(false);
    EXPECT_FALSE(supply->outputEnabled());

    const auto info = supply->identify();
    EXPECT_EQ(0x1234, info.model);
    EXPECT_EQ(0x0002, info.classCode);
  }

  TEST_F(PowerSupplyTest, communication_errors_pass_through) {
    device->setOffline(true);
    EXPECT_THROW(supply->get(Quantity::MeasuredVoltage), core::CommunicationError);
  }

  TEST_F(PowerSupplyTest, probe_builds_a_new_map_from_decimal_points) {
    device->setRegister(0x0005, 0x0121); // V 1 decimal, A 2, W 1
    const RegisterMap base = RegisterMap::defaults();
    const RegisterMap probed = PowerSupply::probeScaling(*client, base);

    EXPECT_DOUBLE_EQ(10.0, probed.at(Quantity::VoltageSetpoint).scale);
    EXPECT_DOUBLE_EQ(10.0, probed.at(Quantity::MeasuredVoltage).scale);
    EXPECT_DOUBLE_EQ(100.0, probed.at(Quantity::MeasuredCurrent).scale);
    EXPECT_DOUBLE_EQ(10.0, probed.at(Quantity::MeasuredPower).scale);
    EXPECT_DOUBLE_EQ(100.0, base.at(Quantity::VoltageSetpoint).scale); // untouched

    PowerSupply coarse(client, probed);
    coarse.set(Quantity::VoltageSetpoint, 12.3);
    EXPECT_EQ(123, device->registerValue(0x0030));
  }

  TEST(RegisterMap, default_layout) {
    const auto map = RegisterMap::defaults();
    EXPECT_EQ(0x0030, map.at(Quantity::VoltageSetpoint).address);
    EXPECT_EQ(0x0010, map.at(Quantity::MeasuredVoltage).address);
    EXPECT_EQ(2, map.at(Quantity::MeasuredPower).width);
    EXPECT_EQ(Access::ReadOnly, map.at(Quantity::ProtectionState).access);
    EXPECT_EQ(Access::ReadWrite, map.at(Quantity::OverCurrentLimit).access);
  }

  TEST(RegisterMap, with_range_returns_a_modified_copy) {
    const auto base = RegisterMap::defaults();
    const auto narrow = base.withRange(Quantity::VoltageSetpoint, 0.0, 30.0);
    EXPECT_DOUBLE_EQ(30.0, narrow.at(Quantity::VoltageSetpoint).maxValue);
    EXPECT_DOUBLE_EQ(100.0, base.at(Quantity::VoltageSetpoint).maxValue);
    EXPECT_THROW(base.withRange(Quantity::VoltageSetpoint, 5.0, 1.0), core::ValidationError);
  }

  TEST(RegisterMap, rejects_invalid_specs) {
    const auto base = RegisterMap::defaults();
    auto spec = base.at(Quantity::VoltageSetpoint);
    spec.width = 3;
    EXPECT_THROW(base.with(Quantity::VoltageSetpoint, spec), core::ValidationError);
    spec.width = 1;
    spec.scale = 0.0;
    EXPECT_THROW(base.with(Quantity::VoltageSetpoint, spec), core::ValidationError);
  }

  TEST(Protection, unknown_bits_are_ignored) {
    EXPECT_TRUE(core::decodeProtectionFlags(0x0100).empty());
    EXPECT_EQ("none", core::toString(core::ProtectionFlags{}));
    EXPECT_EQ(5u, core::decodeProtectionFlags(0x001F).size());
  }

} // namespace anod::test
