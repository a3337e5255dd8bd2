#include <gtest/gtest.h>
#include "transport/remote_shell_transport.hpp"

class RemoteShellTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.ipmiPassword = "s3cret";
        config_.sshPort = 1;
        config_.connectTimeoutSec = 2;
        config_.requestTimeoutSec = 2;

        target_.hostname = "db02";
        target_.managementAddress = "127.0.0.1";
        target_.manufacturer = Manufacturer::Dell;
    }

    ToolConfig config_;
    Target target_;
};

TEST_F(RemoteShellTransportTest, ReportsRemoteShellType) {
    RemoteShellTransport transport(config_);
    EXPECT_EQ(transport.type(), TransportType::RemoteShell);
}

TEST_F(RemoteShellTransportTest, RefusedConnectionIsUnreachable) {
    RemoteShellTransport transport(config_);
    TransportPayload payload;
    payload.command = "racadm storage get pdisks -o";

    TransportResponse response;
    EXPECT_FALSE(transport.execute(target_, payload, response));
    EXPECT_EQ(transport.getLastErrorKind(), ErrorKind::Unreachable);
    EXPECT_NE(transport.getLastError().find("db02"), std::string::npos);
    EXPECT_TRUE(response.output.empty());
}
