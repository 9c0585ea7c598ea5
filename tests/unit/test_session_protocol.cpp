#include "FakeTransport.hpp"
#include "TestFixtures.hpp"
#include "lab-instruments/Errors.hpp"
#include "lab-instruments/session/Session.hpp"

#include <gtest/gtest.h>

using namespace labinst;
using namespace labinst::test;

namespace {

const char *TABLE_YAML = R"(
instrument: {vendor: Acme, model: PSU-1}
operations:
  set_frequency:
    kind: set
    verb: FREQ
    quantity: frequency
    min: 10e6
    max: 40e9
  get_frequency: {kind: query, verb: FREQ, quantity: frequency}
  set_power: {kind: set, verb: POW, quantity: power, units: [dBm], decimals: 2}
  set_voltage: {kind: set, verb: ":VOLT", quantity: voltage, decimals: 4}
  set_count: {kind: set, verb: "AVER:COUN", decimals: 0, min: 0, max: 100}
  measure_voltage:
    kind: query
    verb: ":MEAS:VOLT"
    quantity: voltage
    setup: [':FORM:ELEM "READ"']
  measure_rms:
    kind: query
    verb: "C{ch}:PAVA? RMS"
    quantity: voltage
    setup: ["PACU RMS,C{ch}"]
    reply_field: -1
  tune: {kind: set, verb: F, separator: "", quantity: frequency,
         wire_unit: MHz, decimals: 3}
  output: {kind: state, verb: OUTP, tokens: ["ON", "OFF"]}
  output_enabled: {kind: query, verb: OUTP, returns: bool}
  trace: {kind: query, verb: "TRAC:DATA? TRACE1", returns: list}
  start_sweep: {kind: action, verb: INIT}
)";

} // namespace

class SessionProtocolTest : public LabInstrumentsTest {
protected:
  void SetUp() override {
    LabInstrumentsTest::SetUp();
    table_ = std::make_shared<const CapabilityTable>(
        CapabilityTable::from_yaml_string(TABLE_YAML));
    auto transport = std::make_unique<FakeTransport>();
    fake_ = transport.get();
    session_ = std::make_unique<Session>(
        std::move(transport), table_, Address{"10.0.0.5", 5025}, Timeouts{});
    session_->open();
  }

  std::shared_ptr<const CapabilityTable> table_;
  FakeTransport *fake_ = nullptr;
  std::unique_ptr<Session> session_;
};

TEST_F(SessionProtocolTest, OpenConnectsTransport) {
  EXPECT_EQ(session_->state(), SessionState::Connected);
  EXPECT_TRUE(session_->is_open());
  EXPECT_EQ(fake_->connected_to().host, "10.0.0.5");
  EXPECT_THROW(session_->open(), ProtocolError);
}

TEST_F(SessionProtocolTest, SetFrequencyFormatsInBaseUnit) {
  session_->set_frequency(5, "GHz");
  ASSERT_EQ(fake_->sent().size(), 1u);
  EXPECT_EQ(fake_->sent()[0], "FREQ 5000000000");
  EXPECT_EQ(session_->state(), SessionState::Connected);
}

TEST_F(SessionProtocolTest, QueryConvertsToRequestedUnit) {
  fake_->set_response("FREQ?", "+5.000000000E+09");
  EXPECT_DOUBLE_EQ(session_->get_frequency("GHz"), 5.0);
  EXPECT_DOUBLE_EQ(session_->get("get_frequency"), 5e9);
}

TEST_F(SessionProtocolTest, ValidationHappensBeforeIO) {
  EXPECT_THROW(session_->set_frequency(5, "THz"), UnitError);
  EXPECT_THROW(session_->set_frequency(50, "GHz"), ArgumentError);
  EXPECT_THROW(session_->set_power(1, "mW"), UnitError);
  EXPECT_THROW(session_->set_token("output", "MAYBE"), ArgumentError);
  EXPECT_THROW(session_->set("set_count", 5, "V"), UnitError);
  EXPECT_THROW(session_->set_voltage(0.00001, "V"), ArgumentError);
  EXPECT_THROW(session_->measure_dc_voltage(), ArgumentError);
  EXPECT_TRUE(fake_->sent().empty());
  EXPECT_EQ(session_->state(), SessionState::Connected);
}

TEST_F(SessionProtocolTest, WrongOperationKindIsRejected) {
  EXPECT_THROW(session_->get("set_frequency"), ArgumentError);
  EXPECT_THROW(session_->set("get_frequency", 1, "Hz"), ArgumentError);
  EXPECT_THROW(session_->get_state("get_frequency"), ArgumentError);
  EXPECT_TRUE(fake_->sent().empty());
}

TEST_F(SessionProtocolTest, SetupCommandsPrecedeQuery) {
  fake_->set_response(":MEAS:VOLT?", "+1.500000E+00");
  EXPECT_DOUBLE_EQ(session_->measure_voltage("mV"), 1500.0);
  ASSERT_EQ(fake_->sent().size(), 2u);
  EXPECT_EQ(fake_->sent()[0], ":FORM:ELEM \"READ\"");
  EXPECT_EQ(fake_->sent()[1], ":MEAS:VOLT?");
}

TEST_F(SessionProtocolTest, ChannelTemplatesAndReplyField) {
  fake_->set_response("C2:PAVA? RMS", "C2:PAVA RMS,1.23V");
  EXPECT_DOUBLE_EQ(session_->get("measure_rms", "V", 2), 1.23);
  ASSERT_EQ(fake_->sent().size(), 2u);
  EXPECT_EQ(fake_->sent()[0], "PACU RMS,C2");
  EXPECT_EQ(fake_->sent()[1], "C2:PAVA? RMS");

  EXPECT_THROW(session_->get("measure_rms"), ArgumentError);
}

TEST_F(SessionProtocolTest, WireUnitAndSeparator) {
  session_->set("tune", 5.5, "GHz");
  ASSERT_EQ(fake_->sent().size(), 1u);
  EXPECT_EQ(fake_->sent()[0], "F5500");
}

TEST_F(SessionProtocolTest, PlainNumberSet) {
  session_->set("set_count", 40, "");
  EXPECT_EQ(fake_->sent().back(), "AVER:COUN 40");
  EXPECT_THROW(session_->set("set_count", 400, ""), ArgumentError);
}

TEST_F(SessionProtocolTest, TokensStatesListsActions) {
  session_->output_on();
  session_->set_token("output", "off");
  session_->action("start_sweep");
  EXPECT_EQ(fake_->sent()[0], "OUTP ON");
  EXPECT_EQ(fake_->sent()[1], "OUTP OFF");
  EXPECT_EQ(fake_->sent()[2], "INIT");

  fake_->set_response("OUTP?", "1");
  EXPECT_TRUE(session_->get_state("output_enabled"));

  fake_->set_response("TRAC:DATA? TRACE1", "-80.1,-79.5,-10.0");
  auto trace = session_->get_list("trace");
  ASSERT_EQ(trace.size(), 3u);
  EXPECT_DOUBLE_EQ(trace[2], -10.0);
}

TEST_F(SessionProtocolTest, ReceiveWithoutQueryIsProtocolError) {
  EXPECT_THROW(session_->receive(), ProtocolError);
  EXPECT_EQ(session_->state(), SessionState::Connected);
}

TEST_F(SessionProtocolTest, CommandWhileBusyIsProtocolError) {
  fake_->set_response("*IDN?", "Acme,PSU-1,0,1.0");
  session_->send(scpi::Command("*IDN?", true));
  EXPECT_EQ(session_->state(), SessionState::Busy);

  EXPECT_THROW(session_->write("*RST"), ProtocolError);
  EXPECT_THROW(session_->send(scpi::Command("FREQ?", true)), ProtocolError);
  EXPECT_THROW(session_->set_frequency(1, "GHz"), ProtocolError);
  EXPECT_EQ(fake_->sent().size(), 1u);

  EXPECT_EQ(session_->receive(), "Acme,PSU-1,0,1.0");
  EXPECT_EQ(session_->state(), SessionState::Connected);
}

TEST_F(SessionProtocolTest, RawWriteAndQuery) {
  session_->write("SYST:DISP:UPD ON");
  fake_->set_response("*OPC?", "1");
  EXPECT_EQ(session_->query("*OPC?"), "1");
  EXPECT_THROW(session_->write("*OPC?"), ArgumentError);
  EXPECT_THROW(session_->query("*RST"), ArgumentError);
  EXPECT_THROW(session_->query(scpi::Command("*RST", false)), ArgumentError);
}

TEST_F(SessionProtocolTest, TimeoutLeavesSessionConnected) {
  EXPECT_THROW(session_->get_frequency(), TimeoutError);
  EXPECT_EQ(session_->state(), SessionState::Connected);

  // The late reply is discarded before the next command
  fake_->push_reply("+5.0E+09");
  fake_->set_response("*OPC?", "1");
  fake_->set_response("POW?", "-10.0");
  EXPECT_EQ(session_->query("POW?"), "-10.0");
  EXPECT_EQ(fake_->flush_count(), 1u);
  ASSERT_EQ(fake_->sent().size(), 3u);
  EXPECT_EQ(fake_->sent()[1], "*OPC?");
  EXPECT_EQ(fake_->sent()[2], "POW?");
}

TEST_F(SessionProtocolTest, ReplyArrivingAfterFlushIsDiscarded) {
  EXPECT_THROW(session_->get_frequency(), TimeoutError);

  fake_->deliver_on_flush("+5.0E+09");
  fake_->set_response("*OPC?", "1");
  fake_->set_response("POW?", "-10.0");
  EXPECT_EQ(session_->query("POW?"), "-10.0");
  EXPECT_EQ(session_->state(), SessionState::Connected);

  // Back in step: no second round trip
  session_->set_frequency(1, "GHz");
  EXPECT_EQ(fake_->flush_count(), 1u);
  EXPECT_EQ(fake_->sent().back(), "FREQ 1000000000");
}

TEST_F(SessionProtocolTest, UnansweredResyncIsTimeout) {
  EXPECT_THROW(session_->get_frequency(), TimeoutError);

  fake_->set_response("POW?", "-10.0");
  EXPECT_THROW(session_->query("POW?"), TimeoutError);
  EXPECT_EQ(session_->state(), SessionState::Connected);
  EXPECT_EQ(fake_->sent().back(), "*OPC?");

  // Still out of step, so the next command tries again
  fake_->set_response("*OPC?", "1");
  EXPECT_EQ(session_->query("POW?"), "-10.0");
  EXPECT_EQ(fake_->flush_count(), 2u);
}

TEST_F(SessionProtocolTest, TransportErrorDuringResyncClosesSession) {
  EXPECT_THROW(session_->get_frequency(), TimeoutError);
  fake_->fail_next_send();
  EXPECT_THROW(session_->set_frequency(1, "GHz"), TransportError);
  EXPECT_EQ(session_->state(), SessionState::Closed);
}

TEST_F(SessionProtocolTest, ParseErrorLeavesSessionConnected) {
  fake_->set_response("FREQ?", "garbage");
  EXPECT_THROW(session_->get_frequency(), ParseError);
  EXPECT_EQ(session_->state(), SessionState::Connected);
}

TEST_F(SessionProtocolTest, TransportErrorClosesSession) {
  fake_->fail_next_send();
  EXPECT_THROW(session_->set_frequency(1, "GHz"), TransportError);
  EXPECT_EQ(session_->state(), SessionState::Closed);
  EXPECT_FALSE(session_->is_open());
  EXPECT_THROW(session_->set_frequency(1, "GHz"), TransportError);
}

TEST_F(SessionProtocolTest, ReceiveFailureClosesSession) {
  fake_->fail_next_receive();
  EXPECT_THROW(session_->query("*IDN?"), TransportError);
  EXPECT_EQ(session_->state(), SessionState::Closed);
}

TEST_F(SessionProtocolTest, CloseIsIdempotent) {
  session_->close();
  session_->close();
  EXPECT_EQ(session_->state(), SessionState::Closed);
  EXPECT_EQ(fake_->close_count(), 1u);
  EXPECT_THROW(session_->open(), ProtocolError);
  EXPECT_THROW(session_->receive(), TransportError);
}

TEST_F(SessionProtocolTest, ErrorQueue) {
  fake_->set_response("SYST:ERR?", "-113,\"Undefined header\"");
  try {
    session_->check_errors();
    FAIL() << "Expected DeviceError";
  } catch (const DeviceError &e) {
    EXPECT_EQ(e.code(), -113);
  }
  EXPECT_EQ(session_->state(), SessionState::Connected);

  fake_->set_response("SYST:ERR?", "0,\"No error\"");
  EXPECT_NO_THROW(session_->check_errors());
  EXPECT_TRUE(session_->drain_errors().empty());
}

TEST_F(SessionProtocolTest, IdentityAndCommonCommands) {
  fake_->set_response("*IDN?", "Acme,PSU-1,SN42,1.0\n");
  EXPECT_EQ(session_->identity().serial, "SN42");
  session_->reset();
  EXPECT_EQ(fake_->sent().back(), "*RST");

  fake_->set_response("*OPC?", "1");
  EXPECT_NO_THROW(session_->wait_for_completion());
}

namespace {

const char *PROMPT_TABLE_YAML = R"(
instrument: {vendor: Acme, model: YIG-1}
connection: {terminator: CRLF, prompt: ">", ieee488: false}
operations:
  get_id: {kind: query, verb: R0000, raw: true, returns: text}
  get_min_frequency: {kind: query, verb: R0003, raw: true,
                      quantity: frequency, wire_unit: MHz}
  set_frequency: {kind: set, verb: F, separator: "", quantity: frequency,
                  wire_unit: MHz, decimals: 3}
)";

} // namespace

class PromptSessionTest : public LabInstrumentsTest {
protected:
  void SetUp() override {
    LabInstrumentsTest::SetUp();
    table_ = std::make_shared<const CapabilityTable>(
        CapabilityTable::from_yaml_string(PROMPT_TABLE_YAML));
    auto transport = std::make_unique<FakeTransport>();
    fake_ = transport.get();
    session_ = std::make_unique<Session>(
        std::move(transport), table_, Address{"10.0.0.7", 23}, Timeouts{});
    session_->open();
  }

  std::shared_ptr<const CapabilityTable> table_;
  FakeTransport *fake_ = nullptr;
  std::unique_ptr<Session> session_;
};

TEST_F(PromptSessionTest, PromptIsStrippedFromReplies) {
  fake_->set_response("R0000", ">MLBF-0520");
  EXPECT_EQ(session_->get_id(), "MLBF-0520");

  // A set command leaves a bare prompt that leads the next reply
  session_->set_frequency(5.25, "GHz");
  fake_->set_response("R0003", ">>500.000");
  EXPECT_DOUBLE_EQ(session_->get("get_min_frequency", "GHz"), 0.5);
}

TEST_F(PromptSessionTest, PromptOnlyLinesAreSkipped) {
  fake_->push_reply(">");
  fake_->push_reply("> ");
  fake_->set_response("R0003", "500.000");
  EXPECT_DOUBLE_EQ(session_->get("get_min_frequency", "MHz"), 500.0);
  EXPECT_EQ(session_->state(), SessionState::Connected);
}

TEST_F(PromptSessionTest, NothingButPromptsIsTimeout) {
  fake_->set_response("R0000", ">");
  EXPECT_THROW(session_->get_id(), TimeoutError);
  EXPECT_EQ(session_->state(), SessionState::Connected);
}

TEST_F(PromptSessionTest, WithoutCompletionQueryStaleLinesAreDrained) {
  EXPECT_THROW(session_->get_id(), TimeoutError);

  fake_->deliver_on_flush("MLBF-0520");
  fake_->deliver_on_flush(">");
  fake_->set_response("R0003", "500.000");
  EXPECT_DOUBLE_EQ(session_->get("get_min_frequency", "MHz"), 500.0);
  EXPECT_EQ(fake_->flush_count(), 1u);
  ASSERT_EQ(fake_->sent().size(), 2u);
  EXPECT_EQ(fake_->sent()[1], "R0003");
}

TEST(SessionConnectTest, FailedConnectLeavesSessionDisconnected) {
  auto table = std::make_shared<const CapabilityTable>(
      CapabilityTable::from_yaml_string(TABLE_YAML));
  auto transport = std::make_unique<FakeTransport>();
  transport->fail_connect();
  Session session(std::move(transport), table, Address{"10.0.0.5", 5025},
                  Timeouts{});
  EXPECT_THROW(session.open(), ConnectionError);
  EXPECT_EQ(session.state(), SessionState::Disconnected);
  EXPECT_THROW(session.write("*RST"), TransportError);
}

TEST(SessionConnectTest, RequiresTable) {
  EXPECT_THROW(Session::connect(Address{"127.0.0.1", 5025}, nullptr),
               ArgumentError);
}

TEST(SessionConnectTest, TimeoutsMustBePositiveAndBounded) {
  auto table = std::make_shared<const CapabilityTable>(
      CapabilityTable::from_yaml_string(TABLE_YAML));

  Timeouts zero;
  zero.io_timeout = std::chrono::milliseconds(0);
  EXPECT_THROW(Session(std::make_unique<FakeTransport>(), table,
                       Address{"10.0.0.5", 5025}, zero),
               ArgumentError);

  Timeouts huge;
  huge.connect_timeout = std::chrono::milliseconds::max();
  EXPECT_THROW(Session(std::make_unique<FakeTransport>(), table,
                       Address{"10.0.0.5", 5025}, huge),
               ArgumentError);

  Timeouts longest;
  longest.io_timeout = std::chrono::milliseconds(2147483647);
  EXPECT_NO_THROW(Session(std::make_unique<FakeTransport>(), table,
                          Address{"10.0.0.5", 5025}, longest));
}
