#include <gtest/gtest.h>
#include "metric_spec.hpp"
#include "errors.hpp"
#include <boost/json.hpp>

using namespace fritz;

namespace {

boost::json::object parse(const std::string& text) {
    return boost::json::parse(text).as_object();
}

std::string data_file(const std::string& name) {
    return std::string(FRITZ_TEST_DATA_DIR) + "/" + name;
}

}

TEST(MetricSpecTest, LoadsInDefinitionOrder) {
    auto specs = load_metric_specs(parse(R"({
        "fritzbox_bytes_received": {"service": "WANCommonInterfaceConfig1", "action": "GetTotalBytesReceived",
                                    "param": "NewTotalBytesReceived", "type": "counter"},
        "fritzbox_uptime": {"service": "DeviceInfo1", "action": "GetInfo", "param": "NewUpTime", "type": "Gauge"},
        "fritzbox_aardvark": {"service": "DeviceInfo1", "action": "GetInfo", "param": "NewX", "type": "GAUGE"}
    })"));

    ASSERT_EQ(specs.size(), 3u);
    EXPECT_EQ(specs[0].name, "fritzbox_bytes_received");
    EXPECT_EQ(specs[0].kind, MetricKind::Counter);
    EXPECT_EQ(specs[0].service, "WANCommonInterfaceConfig1");
    EXPECT_EQ(specs[0].action, "GetTotalBytesReceived");
    EXPECT_EQ(specs[0].param, "NewTotalBytesReceived");
    EXPECT_EQ(specs[1].name, "fritzbox_uptime");
    EXPECT_EQ(specs[1].kind, MetricKind::Gauge);
    EXPECT_EQ(specs[2].name, "fritzbox_aardvark");
    EXPECT_EQ(specs[2].kind, MetricKind::Gauge);
}

TEST(MetricSpecTest, DocumentationRecordsCoordinates) {
    MetricSpec spec{"m", "DeviceInfo1", "GetInfo", "NewUpTime", MetricKind::Gauge};
    EXPECT_EQ(spec.documentation(), "Service: DeviceInfo1, Action: GetInfo, Parameter: NewUpTime");
}

TEST(MetricSpecTest, MissingFieldIsConfigError) {
    EXPECT_THROW(load_metric_specs(parse(R"({"m": {"action": "a", "param": "p", "type": "gauge"}})")), ConfigError);
    EXPECT_THROW(load_metric_specs(parse(R"({"m": {"service": "s", "param": "p", "type": "gauge"}})")), ConfigError);
    EXPECT_THROW(load_metric_specs(parse(R"({"m": {"service": "s", "action": "a", "type": "gauge"}})")), ConfigError);
    EXPECT_THROW(load_metric_specs(parse(R"({"m": {"service": "s", "action": "a", "param": "p"}})")), ConfigError);
    EXPECT_THROW(load_metric_specs(parse(R"({"m": {"service": null, "action": "a", "param": "p", "type": "gauge"}})")), ConfigError);
    EXPECT_THROW(load_metric_specs(parse(R"({"m": {"service": 5, "action": "a", "param": "p", "type": "gauge"}})")), ConfigError);
}

TEST(MetricSpecTest, UnknownTypeIsConfigError) {
    try {
        load_metric_specs(parse(R"({"m": {"service": "s", "action": "a", "param": "p", "type": "histogram"}})"));
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("histogram"), std::string::npos);
    }
}

TEST(MetricSpecTest, InvalidDefinitionsAreConfigErrors) {
    EXPECT_THROW(load_metric_specs(parse(R"({"m": "gauge"})")), ConfigError);
    EXPECT_THROW(load_metric_specs(parse(R"({"1bad": {"service": "s", "action": "a", "param": "p", "type": "gauge"}})")), ConfigError);
    EXPECT_THROW(load_metric_specs(parse(R"({"has space": {"service": "s", "action": "a", "param": "p", "type": "gauge"}})")), ConfigError);
}

TEST(MetricSpecTest, DuplicateNameIsConfigError) {
    try {
        load_metric_specs_file(data_file("duplicate.json"));
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("fritzbox_uptime"), std::string::npos);
    }

    // Escaped spelling of the same name
    try {
        load_metric_specs_file(data_file("escaped_duplicate.json"));
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("fritzbox_uptime"), std::string::npos);
    }

    // Same parameter names nested inside different definitions are fine
    EXPECT_NO_THROW(load_metric_specs_file(data_file("metrics.json")));
}

TEST(MetricSpecTest, LoadsExampleFile) {
    auto specs = load_metric_specs_file(data_file("metrics.json"));
    ASSERT_EQ(specs.size(), 4u);
    EXPECT_EQ(specs[0].name, "fritzbox_bytes_received_total");
    EXPECT_EQ(specs[0].kind, MetricKind::Counter);
    EXPECT_EQ(specs[3].name, "fritzbox_uptime_seconds");
    EXPECT_EQ(specs[3].kind, MetricKind::Gauge);
}

TEST(MetricSpecTest, FileErrorsAreConfigErrors) {
    EXPECT_THROW(load_metric_specs_file(data_file("does_not_exist.json")), ConfigError);
    EXPECT_THROW(load_metric_specs_file(data_file("malformed.json")), ConfigError);
    EXPECT_THROW(load_metric_specs_file(data_file("not_an_object.json")), ConfigError);
    EXPECT_THROW(load_metric_specs_file(data_file("empty.json")), ConfigError);
}

TEST(MetricSpecTest, KindToString) {
    EXPECT_EQ(kind_to_string(MetricKind::Gauge), "gauge");
    EXPECT_EQ(kind_to_string(MetricKind::Counter), "counter");
}
