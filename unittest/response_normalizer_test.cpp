#include <gtest/gtest.h>
#include "core/response_normalizer.hpp"
#include <string>

namespace {

TransportResponse cliResponse(const std::string& output, int exitStatus = 0) {
    TransportResponse response;
    response.output = output;
    response.exitStatus = exitStatus;
    return response;
}

TransportResponse restResponse(long status, const std::string& body) {
    TransportResponse response;
    response.httpStatus = status;
    response.output = body;
    return response;
}

std::string racadmDisk(int bay, const std::string& serial) {
    return "Disk.Bay." + std::to_string(bay) + ":Enclosure.Internal.0-1:RAID.Integrated.1-1\n"
           "   State                            = Online\n"
           "   Size                             = 558.38 GB\n"
           "   SerialNumber                     = " + serial + "\n";
}

const char* const kSessionFailure =
    "Error: Unable to establish IPMI v2 / RMCP+ session\n";

} // namespace

class ResponseNormalizerTest : public ::testing::Test {
};

TEST_F(ResponseNormalizerTest, CliOutputLinesAreKept) {
    ExecutionResult result = ResponseNormalizer::fromCliOutput(cliResponse("Chassis Power is on\n\n"));
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.lines.size(), 1u);
    EXPECT_EQ(result.lines[0], "Chassis Power is on");
    EXPECT_FALSE(result.disks.has_value());
}

TEST_F(ResponseNormalizerTest, EmptyCliOutputIsTimeout) {
    ExecutionResult result = ResponseNormalizer::fromCliOutput(cliResponse("  \n"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::TimedOut);
}

TEST_F(ResponseNormalizerTest, TimeoutExitStatusIsTimeout) {
    EXPECT_EQ(ResponseNormalizer::fromCliOutput(cliResponse("partial\n", 124)).errorKind, ErrorKind::TimedOut);
    EXPECT_EQ(ResponseNormalizer::fromCliOutput(cliResponse("partial\n", 137)).errorKind, ErrorKind::TimedOut);
}

TEST_F(ResponseNormalizerTest, SessionFailureWithAuthSignatureIsAuthFailure) {
    TransportResponse response = cliResponse(kSessionFailure, 1);
    response.authFailureDetected = true;
    ExecutionResult result = ResponseNormalizer::fromCliOutput(response);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::AuthenticationFailed);
}

TEST_F(ResponseNormalizerTest, SessionFailureWithoutAuthSignatureIsProtocolError) {
    ExecutionResult result = ResponseNormalizer::fromCliOutput(cliResponse(kSessionFailure, 1));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::ProtocolError);
    EXPECT_EQ(result.errorMessage, "Error: Unable to establish IPMI v2 / RMCP+ session");
}

TEST_F(ResponseNormalizerTest, ParsesRacadmDisks) {
    std::vector<DiskEntry> disks =
        ResponseNormalizer::parseRacadmDisks(racadmDisk(0, "S0M1AAAA") + racadmDisk(1, "S0M1BBBB"));
    ASSERT_EQ(disks.size(), 2u);
    EXPECT_EQ(disks[0].bay, "Disk.Bay.0");
    EXPECT_EQ(disks[0].status, "Online");
    EXPECT_EQ(disks[0].sizeOrCapacity, "558.38 GB");
    EXPECT_EQ(disks[0].serialOrHealth, "S0M1AAAA");
    EXPECT_EQ(disks[1].bay, "Disk.Bay.1");
    EXPECT_EQ(disks[1].serialOrHealth, "S0M1BBBB");
}

TEST_F(ResponseNormalizerTest, EvenDriveCountHasNoWarning) {
    ExecutionResult result = ResponseNormalizer::fromDriveStatus(
        "db02", cliResponse(racadmDisk(0, "A") + racadmDisk(1, "B")));
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(result.lines[0], "db02: 2 drive(s) reported");
    ASSERT_TRUE(result.disks.has_value());
    EXPECT_EQ(result.disks->size(), 2u);
}

TEST_F(ResponseNormalizerTest, OddDriveCountWarns) {
    ExecutionResult result = ResponseNormalizer::fromDriveStatus(
        "db02", cliResponse(racadmDisk(0, "A") + racadmDisk(1, "B") + racadmDisk(2, "C")));
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0], "WARNING: db02 reports an odd number of drives (3)");
}

TEST_F(ResponseNormalizerTest, FailedRacadmIsProtocolError) {
    ExecutionResult result = ResponseNormalizer::fromDriveStatus(
        "db02", cliResponse("ERROR: Unable to perform the requested operation.\n", 1));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::ProtocolError);
    EXPECT_NE(result.errorMessage.find("Unable to perform"), std::string::npos);
}

TEST_F(ResponseNormalizerTest, RacadmErrorWithZeroExitIsProtocolError) {
    ExecutionResult result = ResponseNormalizer::fromDriveStatus(
        "db02", cliResponse("\nERROR: SWC0242 : Incorrect input arguments.\n", 0));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::ProtocolError);
    EXPECT_NE(result.errorMessage.find("SWC0242"), std::string::npos);
    EXPECT_FALSE(result.disks.has_value());
}

TEST_F(ResponseNormalizerTest, DriveLocateSuccessMessage) {
    TransportResponse response = cliResponse("STOR095 : Storage operation is successfully completed.\n");

    ExecutionResult on = ResponseNormalizer::fromDriveLocate("db02", "3", true, response);
    ASSERT_TRUE(on.success);
    EXPECT_EQ(on.lines[0], "db02: Drive in Slot 3 sucessfully set to blink.");

    ExecutionResult off = ResponseNormalizer::fromDriveLocate("db02", "3", false, response);
    ASSERT_TRUE(off.success);
    EXPECT_EQ(off.lines[0], "db02: Drive in Slot 3 sucessfully set to unblink.");
}

TEST_F(ResponseNormalizerTest, DriveLocateWithoutSuccessCodeFails) {
    ExecutionResult result = ResponseNormalizer::fromDriveLocate(
        "db02", "9", true, cliResponse("ERROR: STOR0103 : Invalid FQDD.\n", 1));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::ProtocolError);
}

TEST_F(ResponseNormalizerTest, FormatsCapacityInDecimalUnits) {
    EXPECT_EQ(ResponseNormalizer::formatCapacity(1600321314816.0), "1.60 TB");
    EXPECT_EQ(ResponseNormalizer::formatCapacity(960197124096.0), "960.20 GB");
    EXPECT_EQ(ResponseNormalizer::formatCapacity(512.0), "512.00 B");
}

TEST_F(ResponseNormalizerTest, DellNvmeRecordsAreFilteredByBay) {
    const char* body = R"({
        "Drives": [
            {
                "Id": "Disk.Bay.0:Enclosure.Internal.0-1",
                "Model": "Dell Ent NVMe P5600",
                "CapacityBytes": 1600321314816,
                "Status": {"State": "Enabled", "Health": "OK"}
            },
            {
                "Id": "Disk.Direct.0-0:AHCI.Slot.2-1",
                "Model": "BOSS M.2",
                "CapacityBytes": 240057409536,
                "Status": {"State": "Enabled", "Health": "OK"}
            }
        ]
    })";

    ExecutionResult result =
        ResponseNormalizer::fromNvmeStatus("db02", Manufacturer::Dell, restResponse(200, body));
    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.disks.has_value());
    ASSERT_EQ(result.disks->size(), 1u);
    const DiskEntry& disk = result.disks->front();
    EXPECT_EQ(disk.bay, "Disk.Bay.0");
    EXPECT_EQ(disk.model, "Dell Ent NVMe P5600");
    EXPECT_EQ(disk.sizeOrCapacity, "1.60 TB");
    EXPECT_EQ(disk.status, "Enabled");
    EXPECT_EQ(disk.serialOrHealth, "OK");
}

TEST_F(ResponseNormalizerTest, SupermicroNvmeUsesServiceLabel) {
    const char* body = R"({
        "Members": [
            {
                "@odata.id": "/redfish/v1/Chassis/NVMeSSD.0.StorageBackplane.1/Drives/NVMe0",
                "Id": "NVMe0",
                "Model": "SAMSUNG MZQL23T8HCLS",
                "CapacityBytes": 3840755982336,
                "PhysicalLocation": {"PartLocation": {"ServiceLabel": "NVMe Slot 0"}},
                "Status": {"State": "Enabled", "Health": "Warning"}
            }
        ]
    })";

    ExecutionResult result =
        ResponseNormalizer::fromNvmeStatus("gpu07", Manufacturer::Supermicro, restResponse(200, body));
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.disks->size(), 1u);
    EXPECT_EQ(result.disks->front().bay, "NVMe Slot 0");
    EXPECT_EQ(result.disks->front().serialOrHealth, "Warning");
    EXPECT_EQ(result.lines[0], "gpu07: 1 NVMe drive(s) reported");
}

TEST_F(ResponseNormalizerTest, NoMatchingNvmeRecordsIsNotAnError) {
    ExecutionResult result = ResponseNormalizer::fromNvmeStatus(
        "db02", Manufacturer::Dell, restResponse(200, R"({"Drives": []})"));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.lines[0], "db02: no compatible drives found");
    ASSERT_TRUE(result.disks.has_value());
    EXPECT_TRUE(result.disks->empty());
}

TEST_F(ResponseNormalizerTest, NvmeStatusErrorSurfacesExtendedInfo) {
    const char* body = R"({
        "error": {
            "code": "Base.1.8.GeneralError",
            "@Message.ExtendedInfo": [{"Message": "The resource at the URI was not found."}]
        }
    })";
    ExecutionResult result =
        ResponseNormalizer::fromNvmeStatus("db02", Manufacturer::Dell, restResponse(404, body));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::ProtocolError);
    EXPECT_NE(result.errorMessage.find("The resource at the URI was not found."), std::string::npos);
}

TEST_F(ResponseNormalizerTest, MalformedNvmeBodyIsProtocolError) {
    ExecutionResult result =
        ResponseNormalizer::fromNvmeStatus("db02", Manufacturer::Dell, restResponse(200, "<html>"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::ProtocolError);
}

TEST_F(ResponseNormalizerTest, NvmeLocateSuccess) {
    ExecutionResult result = ResponseNormalizer::fromNvmeLocate("db02", "4", false, restResponse(200, "{}"));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.lines[0], "db02: NVMe drive in Slot 4 sucessfully set to unblink.");
}

TEST_F(ResponseNormalizerTest, UndocumentedLocateStatusCarriesStatusCode) {
    ExecutionResult result = ResponseNormalizer::fromNvmeLocate("db02", "4", true, restResponse(202, ""));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::ProtocolError);
    EXPECT_NE(result.errorMessage.find("unexpected HTTP status 202"), std::string::npos);
}
