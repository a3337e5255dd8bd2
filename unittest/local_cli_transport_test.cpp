#include <gtest/gtest.h>
#include "transport/local_cli_transport.hpp"
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace {

// Returns queued results in order and records every command line
class ScriptedProcessRunner : public ProcessRunner {
public:
    void push(int exitStatus, const std::string& output, bool started = true) {
        Step step;
        step.started = started;
        step.result.exitStatus = exitStatus;
        step.result.output = output;
        steps_.push_back(step);
    }

    bool run(const std::string& command, const ProcessEnvironment& environment,
             ProcessResult& result) override {
        commands.push_back(command);
        environments.push_back(environment);
        if (steps_.empty()) {
            result.exitStatus = 0;
            result.output.clear();
            return true;
        }
        Step step = steps_.front();
        steps_.pop_front();
        result = step.result;
        return step.started;
    }

    std::vector<std::string> commands;
    std::vector<ProcessEnvironment> environments;

private:
    struct Step {
        bool started{true};
        ProcessResult result;
    };
    std::deque<Step> steps_;
};

const char* const kAlivePing =
    "2 packets transmitted, 2 received, 0% packet loss, time 1001ms\n";
const char* const kDeadPing =
    "2 packets transmitted, 0 received, 100% packet loss, time 1020ms\n";

} // namespace

class LocalCliTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.ipmiPassword = "s3cret";
        config_.ipmiUsername = "admin";
        runner_ = std::make_shared<ScriptedProcessRunner>();
        transport_ = std::make_unique<LocalCliTransport>(config_, runner_);

        target_.hostname = "db02";
        target_.managementAddress = "10.1.2.3";
        target_.manufacturer = Manufacturer::Dell;
    }

    TransportPayload payload(const std::string& command) {
        TransportPayload p;
        p.command = command;
        return p;
    }

    ToolConfig config_;
    std::shared_ptr<ScriptedProcessRunner> runner_;
    std::unique_ptr<LocalCliTransport> transport_;
    Target target_;
};

TEST_F(LocalCliTransportTest, BuildsPingCommand) {
    EXPECT_EQ(transport_->buildPingCommand("10.1.2.3"), "ping -c 2 -W 1 '10.1.2.3'");
}

TEST_F(LocalCliTransportTest, BuildsIpmiCommandWithTimeouts) {
    std::string line = transport_->buildIpmiCommand("10.1.2.3", "chassis power status", false);
    EXPECT_EQ(line,
              "timeout -k 5 30 'ipmitool' -I 'lanplus' -H '10.1.2.3' -U 'admin' -E chassis power status");

    std::string verbose = transport_->buildIpmiCommand("10.1.2.3", "sensor", true);
    EXPECT_NE(verbose.find(" -E -v sensor"), std::string::npos);
}

TEST_F(LocalCliTransportTest, InterfaceIsQuoted) {
    config_.ipmiInterface = "lanplus; touch /tmp/x";
    LocalCliTransport transport(config_, runner_);
    std::string line = transport.buildIpmiCommand("10.1.2.3", "sensor", false);
    EXPECT_NE(line.find(" -I 'lanplus; touch /tmp/x' "), std::string::npos);
}

TEST_F(LocalCliTransportTest, PasswordTravelsInEnvironmentOnly) {
    runner_->push(0, kAlivePing);
    runner_->push(0, "Chassis Power is on\n");

    TransportResponse response;
    ASSERT_TRUE(transport_->execute(target_, payload("chassis power status"), response));
    ASSERT_EQ(runner_->commands.size(), 2u);
    for (const auto& command : runner_->commands) {
        EXPECT_EQ(command.find("s3cret"), std::string::npos) << command;
    }

    EXPECT_TRUE(runner_->environments[0].empty());
    ASSERT_EQ(runner_->environments[1].count("IPMI_PASSWORD"), 1u);
    EXPECT_EQ(runner_->environments[1].at("IPMI_PASSWORD"), "s3cret");
}

TEST_F(LocalCliTransportTest, ReturnsOutputOfReachableBmc) {
    runner_->push(0, kAlivePing);
    runner_->push(0, "Chassis Power is on\n");

    TransportResponse response;
    ASSERT_TRUE(transport_->execute(target_, payload("chassis power status"), response));
    EXPECT_EQ(response.output, "Chassis Power is on\n");
    EXPECT_EQ(response.exitStatus, 0);
    EXPECT_FALSE(response.authFailureDetected);
    ASSERT_EQ(runner_->commands.size(), 2u);
    EXPECT_EQ(runner_->commands[0].rfind("ping", 0), 0u);
}

TEST_F(LocalCliTransportTest, UnreachableBmcSkipsIpmitool) {
    runner_->push(1, kDeadPing);

    TransportResponse response;
    EXPECT_FALSE(transport_->execute(target_, payload("chassis power cycle"), response));
    EXPECT_EQ(transport_->getLastErrorKind(), ErrorKind::Unreachable);
    EXPECT_EQ(runner_->commands.size(), 1u);
}

TEST_F(LocalCliTransportTest, FailedPingCountsAsUnreachable) {
    runner_->push(127, "sh: 1: ping: not found\n");

    TransportResponse response;
    EXPECT_FALSE(transport_->execute(target_, payload("chassis power status"), response));
    EXPECT_EQ(transport_->getLastErrorKind(), ErrorKind::Unreachable);
    EXPECT_NE(transport_->getLastError().find("ping: not found"), std::string::npos);
    EXPECT_EQ(runner_->commands.size(), 1u);

    runner_->push(2, "ping: bmc-db02.invalid: Name or service not known\n");
    EXPECT_FALSE(transport_->execute(target_, payload("chassis power status"), response));
    EXPECT_EQ(transport_->getLastErrorKind(), ErrorKind::Unreachable);
    EXPECT_EQ(runner_->commands.size(), 2u);
}

TEST_F(LocalCliTransportTest, EmptyAddressIsRejected) {
    target_.managementAddress.clear();
    TransportResponse response;
    EXPECT_FALSE(transport_->execute(target_, payload("sensor"), response));
    EXPECT_EQ(transport_->getLastErrorKind(), ErrorKind::InvalidAddress);
    EXPECT_TRUE(runner_->commands.empty());
}

TEST_F(LocalCliTransportTest, SessionFailureTriggersReadOnlyDiagnostic) {
    runner_->push(0, kAlivePing);
    runner_->push(1, "Error: Unable to establish IPMI v2 / RMCP+ session\n");
    runner_->push(1, ">> Sending IPMI command payload\nRAKP 2 HMAC is invalid\n");

    TransportResponse response;
    ASSERT_TRUE(transport_->execute(target_, payload("chassis power cycle"), response));
    EXPECT_TRUE(response.authFailureDetected);
    ASSERT_EQ(runner_->commands.size(), 3u);
    EXPECT_EQ(runner_->environments[2].at("IPMI_PASSWORD"), "s3cret");

    const std::string& diagnostic = runner_->commands[2];
    EXPECT_NE(diagnostic.find(" -v chassis power status"), std::string::npos);
    EXPECT_EQ(diagnostic.find("power cycle"), std::string::npos);
}

TEST_F(LocalCliTransportTest, SessionFailureWithoutAuthSignature) {
    runner_->push(0, kAlivePing);
    runner_->push(1, "Error: Unable to establish IPMI v2 / RMCP+ session\n");
    runner_->push(1, "Get Auth Capabilities error\n");

    TransportResponse response;
    ASSERT_TRUE(transport_->execute(target_, payload("sel elist"), response));
    EXPECT_FALSE(response.authFailureDetected);
}

TEST_F(LocalCliTransportTest, RecognisesAuthenticationSignatures) {
    EXPECT_TRUE(LocalCliTransport::hasAuthenticationSignature("RAKP 2 message indicates an error : unauthorized name"));
    EXPECT_TRUE(LocalCliTransport::hasAuthenticationSignature("invalid authentication algorithm"));
    EXPECT_FALSE(LocalCliTransport::hasAuthenticationSignature("Insufficient resources for session"));
}

TEST_F(LocalCliTransportTest, ProcessStartFailureIsProtocolError) {
    runner_->push(0, kAlivePing);
    runner_->push(-1, "", false);

    TransportResponse response;
    EXPECT_FALSE(transport_->execute(target_, payload("sensor"), response));
    EXPECT_EQ(transport_->getLastErrorKind(), ErrorKind::ProtocolError);
}
