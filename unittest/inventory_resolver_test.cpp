#include <gtest/gtest.h>
#include "inventory/inventory_resolver.hpp"
#include "inventory/rest_inventory_resolver.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

class InventoryResolverTest : public ::testing::Test {
protected:
    bool select(const json& records) {
        return selectInventoryRecord("db02", records, target_, kind_, error_);
    }

    Target target_;
    ErrorKind kind_{ErrorKind::None};
    std::string error_;
};

TEST_F(InventoryResolverTest, SingleRecordResolves) {
    json records = {{"results", {{{"management_address", "10.1.2.3"}, {"manufacturer", "Dell Inc."}}}}};
    ASSERT_TRUE(select(records)) << error_;
    EXPECT_EQ(target_.hostname, "db02");
    EXPECT_EQ(target_.managementAddress, "10.1.2.3");
    EXPECT_EQ(target_.manufacturer, Manufacturer::Dell);
    EXPECT_EQ(kind_, ErrorKind::None);
}

TEST_F(InventoryResolverTest, BareArrayIsAccepted) {
    json records = json::array({{{"management_address", "10.1.2.4"}, {"manufacturer", "Supermicro"}}});
    ASSERT_TRUE(select(records)) << error_;
    EXPECT_EQ(target_.manufacturer, Manufacturer::Supermicro);
}

TEST_F(InventoryResolverTest, NoRecordsIsNotFound) {
    EXPECT_FALSE(select(json{{"results", json::array()}}));
    EXPECT_EQ(kind_, ErrorKind::NotFound);
}

TEST_F(InventoryResolverTest, SeveralRecordsIsAmbiguous) {
    json records = json::array({
        {{"management_address", "10.1.2.3"}, {"manufacturer", "Dell"}},
        {{"management_address", "10.9.2.3"}, {"manufacturer", "Dell"}}
    });
    EXPECT_FALSE(select(records));
    EXPECT_EQ(kind_, ErrorKind::Ambiguous);
    EXPECT_NE(error_.find("qualify the hostname"), std::string::npos);
}

TEST_F(InventoryResolverTest, MissingFieldsAreMissingAttribute) {
    EXPECT_FALSE(select(json::array({{{"manufacturer", "Dell"}}})));
    EXPECT_EQ(kind_, ErrorKind::MissingAttribute);

    EXPECT_FALSE(select(json::array({{{"management_address", "10.1.2.3"}}})));
    EXPECT_EQ(kind_, ErrorKind::MissingAttribute);

    EXPECT_FALSE(select(json::array({{{"management_address", nullptr}, {"manufacturer", "Dell"}}})));
    EXPECT_EQ(kind_, ErrorKind::MissingAttribute);
}

TEST_F(InventoryResolverTest, PlaceholderAddressesAreInvalid) {
    for (const char* address : {"", "\"\"", "''", "0.0.0.0", "  "}) {
        EXPECT_FALSE(select(json::array({{{"management_address", address}, {"manufacturer", "Dell"}}})))
            << address;
        EXPECT_EQ(kind_, ErrorKind::InvalidAddress) << address;
    }
}

TEST_F(InventoryResolverTest, UnexpectedDocumentIsProtocolError) {
    EXPECT_FALSE(select(json{{"detail", "server error"}}));
    EXPECT_EQ(kind_, ErrorKind::ProtocolError);
}

TEST_F(InventoryResolverTest, UnknownManufacturerStillResolves) {
    ASSERT_TRUE(select(json::array({{{"management_address", "10.1.2.3"}, {"manufacturer", "Lenovo"}}})));
    EXPECT_EQ(target_.manufacturer, Manufacturer::Unknown);
}

TEST_F(InventoryResolverTest, ManufacturerNamesAreMatchedLoosely) {
    EXPECT_EQ(manufacturerFromString("DELL INC."), Manufacturer::Dell);
    EXPECT_EQ(manufacturerFromString("Super Micro Computer"), Manufacturer::Supermicro);
    EXPECT_EQ(manufacturerFromString("HPE"), Manufacturer::Unknown);
}

TEST_F(InventoryResolverTest, RestResolverWithoutUrlIsConfigurationError) {
    ToolConfig config;
    RestInventoryResolver resolver(config);
    Target target;
    EXPECT_FALSE(resolver.resolve("db02", target));
    EXPECT_EQ(resolver.getLastErrorKind(), ErrorKind::ConfigurationError);
}
