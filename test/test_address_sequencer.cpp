// test_address_sequencer.cpp - Sequencing order, skip logic and failure isolation
#include <gtest/gtest.h>

#include <vector>

#include "address_sequencer.h"
#include "bus_session.h"
#include "fake_board.h"

using namespace multitof;
using namespace multitof::test;

namespace {

DeviceSpec spec(int line, uint8_t addr, int8_t offset = 0) {
  DeviceSpec d;
  d.enable_line = line;
  d.target_address = addr;
  d.offset = offset;
  return d;
}

class AddressSequencerTest : public ::testing::Test {
protected:
  AddressSequencerTest() : session(busFor(board), pinsFor(board)), sequencer(session) {}

  // Three sensors on lines 10, 9, 11 going to 0x30, 0x31, 0x32
  void useThreeSensors(int8_t offset = 100) {
    board.addDevice(10, 11);
    board.addDevice(9, 22);
    board.addDevice(11, 33);
    devices.push_back(spec(10, 0x30, offset));
    devices.push_back(spec(9, 0x31, offset));
    devices.push_back(spec(11, 0x32, offset));
  }

  Status run(PinScheme scheme = PinScheme::GPIO) {
    return sequencer.initialize(devices, 0x29, 100, scheme, out, report);
  }

  std::vector<uint8_t> resultAddresses() const {
    std::vector<uint8_t> a;
    for (size_t i = 0; i < out.size(); i++) a.push_back(out[i].address());
    return a;
  }

  FakeBoard board;
  BusSession session;
  AddressSequencer sequencer;
  std::vector<DeviceSpec> devices;
  std::vector<SequencedDevice> out;
  SequenceReport report;
};

}  // namespace

TEST_F(AddressSequencerTest, SequencesThreeSensorsInInputOrder) {
  useThreeSensors();
  ASSERT_TRUE(run().isOk());

  std::vector<Event> asserts = board.eventsOf(Event::ASSERT);
  ASSERT_EQ(3u, asserts.size());
  EXPECT_EQ(10, asserts[0].line);
  EXPECT_EQ(9, asserts[1].line);
  EXPECT_EQ(11, asserts[2].line);

  std::vector<Event> writes = board.eventsOf(Event::WRITE);
  ASSERT_EQ(3u, writes.size());
  const uint8_t expected[] = { 0x30, 0x31, 0x32 };
  for (size_t i = 0; i < 3; i++) {
    EXPECT_EQ(0x212, writes[i].reg);
    EXPECT_EQ(expected[i], writes[i].value);
    EXPECT_EQ(0x29, writes[i].address);
  }

  // Final handles at the target addresses carry the offset
  std::vector<Event> opens = board.eventsOf(Event::OPEN);
  ASSERT_EQ(6u, opens.size());
  for (size_t i = 0; i < 3; i++) {
    EXPECT_EQ(expected[i], opens[3 + i].address);
    EXPECT_EQ(100, opens[3 + i].offset);
  }

  ASSERT_EQ(3u, out.size());
  for (size_t i = 0; i < 3; i++) {
    EXPECT_EQ(expected[i], out[i].address());
    EXPECT_EQ(100, out[i].offset());
    EXPECT_EQ(i, out[i].index());
    EXPECT_EQ(DeviceState::READY, report.outcomes[i].state);
  }
  EXPECT_EQ(3u, report.readyCount());
  EXPECT_EQ(0u, report.failedCount());
}

TEST_F(AddressSequencerTest, HoldsAllLinesLowThenScansBeforeEnablingAny) {
  useThreeSensors();
  ASSERT_TRUE(run().isOk());

  const std::vector<Event>& ev = board.events;
  ASSERT_GE(ev.size(), 5u);
  EXPECT_EQ(Event::MODE, ev[0].kind);
  EXPECT_EQ(Event::DEASSERT, ev[1].kind);
  EXPECT_EQ(Event::DEASSERT, ev[2].kind);
  EXPECT_EQ(Event::DEASSERT, ev[3].kind);
  EXPECT_EQ(Event::SCAN, ev[4].kind);
  EXPECT_EQ(1u, board.count(Event::SCAN));
}

TEST_F(AddressSequencerTest, WaitsBootstrapDelayBetweenEnableAndOpen) {
  useThreeSensors();
  ASSERT_TRUE(run().isOk());

  const std::vector<Event>& ev = board.events;
  for (size_t i = 0; i < ev.size(); i++) {
    if (ev[i].kind != Event::ASSERT) continue;
    ASSERT_LT(i + 2, ev.size());
    EXPECT_EQ(Event::DELAY, ev[i + 1].kind);
    EXPECT_EQ(100u, ev[i + 1].ms);
    EXPECT_EQ(Event::OPEN, ev[i + 2].kind);
    EXPECT_EQ(0x29, ev[i + 2].address);
  }
}

TEST_F(AddressSequencerTest, NeverTwoUnreassignedDevicesPowered) {
  for (int line = 0; line < 6; line++) {
    board.addDevice(line);
    devices.push_back(spec(line, (uint8_t)(0x40 + line)));
  }
  ASSERT_TRUE(run().isOk());
  EXPECT_EQ(6u, out.size());
  EXPECT_LE(board.max_unreset, 1);
}

TEST_F(AddressSequencerTest, AlreadyLiveAddressIsNotReassigned) {
  board.addDevice(10);
  board.addLiveDevice(0x31);
  board.addDevice(11);
  devices.push_back(spec(10, 0x30));
  devices.push_back(spec(9, 0x31));
  devices.push_back(spec(11, 0x32));

  ASSERT_TRUE(run().isOk());

  EXPECT_EQ(1u, report.busy.count(0x31));
  EXPECT_TRUE(report.outcomes[1].already_live);
  EXPECT_EQ(DeviceState::READY, report.outcomes[1].state);

  std::vector<Event> writes = board.eventsOf(Event::WRITE);
  ASSERT_EQ(2u, writes.size());
  for (size_t i = 0; i < writes.size(); i++) EXPECT_NE(0x31, writes[i].value);
  for (size_t i = 0; i < board.events.size(); i++) {
    if (board.events[i].kind == Event::ASSERT) EXPECT_NE(9, board.events[i].line);
  }

  std::vector<uint8_t> expected;
  expected.push_back(0x30);
  expected.push_back(0x31);
  expected.push_back(0x32);
  EXPECT_EQ(expected, resultAddresses());
}

TEST_F(AddressSequencerTest, WriteFailureIsolatedToThatDevice) {
  useThreeSensors();
  board.fail_write_value.insert(0x31);

  ASSERT_TRUE(run().isOk());

  EXPECT_EQ(DeviceState::FAILED, report.outcomes[1].state);
  EXPECT_EQ(DeviceState::BOOTSTRAPPED, report.outcomes[1].failed_in);
  EXPECT_EQ(ErrorKind::TRANSPORT, report.outcomes[1].error.kind);

  // Device 3 was still enabled and written after the failure
  EXPECT_EQ(3u, board.count(Event::ASSERT));
  EXPECT_EQ(0x32, board.eventsOf(Event::WRITE)[2].value);

  ASSERT_EQ(2u, out.size());
  EXPECT_EQ(0x30, out[0].address());
  EXPECT_EQ(0u, out[0].index());
  EXPECT_EQ(0x32, out[1].address());
  EXPECT_EQ(2u, out[1].index());

  // Failed device keeps its line asserted
  for (size_t i = 0; i < board.events.size(); i++) {
    const Event& e = board.events[i];
    if (e.kind == Event::ASSERT && e.line == 9) {
      for (size_t j = i + 1; j < board.events.size(); j++) {
        EXPECT_FALSE(board.events[j].kind == Event::DEASSERT && board.events[j].line == 9);
      }
    }
  }
}

TEST_F(AddressSequencerTest, MissingDeviceFailsWhileEnabling) {
  board.addDevice(10);
  board.addDevice(11);  // nothing wired behind line 9
  devices.push_back(spec(10, 0x30));
  devices.push_back(spec(9, 0x31));
  devices.push_back(spec(11, 0x32));

  ASSERT_TRUE(run().isOk());

  EXPECT_EQ(DeviceState::FAILED, report.outcomes[1].state);
  EXPECT_EQ(DeviceState::ENABLING, report.outcomes[1].failed_in);
  ASSERT_EQ(2u, out.size());
  EXPECT_EQ(0x30, out[0].address());
  EXPECT_EQ(0x32, out[1].address());
}

TEST_F(AddressSequencerTest, FinalOpenFailureDropsDeviceWithoutRetry) {
  useThreeSensors();
  board.fail_open.insert(0x32);

  ASSERT_TRUE(run().isOk());

  EXPECT_EQ(DeviceState::FAILED, report.outcomes[2].state);
  EXPECT_EQ(DeviceState::REASSIGNED, report.outcomes[2].failed_in);
  ASSERT_EQ(2u, out.size());

  size_t opens_at_target = 0;
  std::vector<Event> opens = board.eventsOf(Event::OPEN);
  for (size_t i = 0; i < opens.size(); i++) {
    if (opens[i].address == 0x32) opens_at_target++;
  }
  EXPECT_EQ(1u, opens_at_target);
}

TEST_F(AddressSequencerTest, ResultIsSubsequenceOfInputWhateverFails) {
  for (int line = 0; line < 5; line++) {
    board.addDevice(line);
    devices.push_back(spec(line, (uint8_t)(0x50 + line)));
  }
  for (int k = 0; k < 5; k++) {
    board.fail_write_value.clear();
    board.fail_write_value.insert((uint8_t)(0x50 + k));

    ASSERT_TRUE(run().isOk());
    ASSERT_EQ(4u, out.size()) << "failing device " << k;
    for (size_t i = 1; i < out.size(); i++) {
      EXPECT_LT(out[i - 1].index(), out[i].index());
    }
    for (size_t i = 0; i < out.size(); i++) {
      EXPECT_NE((size_t)k, out[i].index());
      EXPECT_EQ(devices[out[i].index()].target_address, out[i].address());
    }
  }
}

TEST_F(AddressSequencerTest, ReadsGoToTheReassignedAddress) {
  useThreeSensors();
  ASSERT_TRUE(run().isOk());

  board.events.clear();
  uint8_t mm = 0;
  ASSERT_TRUE(out[1].readRange(mm).isOk());
  EXPECT_EQ(22, mm);

  std::vector<Event> reads = board.eventsOf(Event::READ);
  ASSERT_EQ(1u, reads.size());
  EXPECT_EQ(0x31, reads[0].address);
}

TEST_F(AddressSequencerTest, ProbeFailureSequencesEverything) {
  useThreeSensors();
  board.fail_scan = true;

  ASSERT_TRUE(run().isOk());

  EXPECT_EQ(ErrorKind::TRANSPORT, report.probe.kind);
  EXPECT_TRUE(report.busy.empty());
  EXPECT_EQ(3u, board.count(Event::WRITE));
  EXPECT_EQ(3u, out.size());
}

TEST_F(AddressSequencerTest, AddressAbove127IsConfigurationErrorWithoutHardwareAction) {
  useThreeSensors();
  devices[2].target_address = 200;

  Status st = run();
  EXPECT_EQ(ErrorKind::CONFIGURATION, st.kind);
  EXPECT_TRUE(board.events.empty());
  EXPECT_TRUE(out.empty());
}

TEST_F(AddressSequencerTest, DefaultAddressOutOfRangeIsConfigurationError) {
  useThreeSensors();
  Status st = sequencer.initialize(devices, 0x80, 100, PinScheme::GPIO, out, report);
  EXPECT_EQ(ErrorKind::CONFIGURATION, st.kind);
  EXPECT_TRUE(board.events.empty());
}

TEST_F(AddressSequencerTest, UnsupportedPinSchemeIsConfigurationError) {
  useThreeSensors();
  EXPECT_EQ(ErrorKind::CONFIGURATION, run(PinScheme::BOARD).kind);
  EXPECT_EQ(ErrorKind::CONFIGURATION, run(static_cast<PinScheme>(7)).kind);
  EXPECT_TRUE(board.events.empty());

  board.support_board_scheme = true;
  EXPECT_TRUE(run(PinScheme::BOARD).isOk());
  EXPECT_EQ((uint8_t)PinScheme::BOARD, board.events[0].value);
}

TEST_F(AddressSequencerTest, EmptyDeviceListStillScansOnce) {
  ASSERT_TRUE(run().isOk());
  EXPECT_TRUE(out.empty());
  EXPECT_EQ(1u, board.count(Event::SCAN));
  EXPECT_EQ(0u, board.count(Event::ASSERT));
}
