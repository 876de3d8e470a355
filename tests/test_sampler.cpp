#include <gtest/gtest.h>
#include "sampler.hpp"
#include "errors.hpp"
#include "exported_metric.hpp"
#include "fake_transport.hpp"

using namespace fritz;

namespace {

MetricSpec make_spec(const std::string& name, MetricKind kind) {
    return MetricSpec{name, "WANCommonInterfaceConfig1", "GetTotalBytesSent", "NewTotalBytesSent", kind};
}

}

class SamplerTest : public ::testing::Test {
protected:
    MetricsRegistry registry;
    ScriptedTransport transport;
    Sampler sampler{transport};
};

TEST_F(SamplerTest, ExtractsNamedParameter) {
    transport.push_response("WANCommonInterfaceConfig1", "GetTotalBytesSent",
                            {{"NewTotalBytesSent", "4711"}, {"NewOther", "1"}});

    Sample s = sampler.sample(make_spec("bytes_sent", MetricKind::Counter));
    EXPECT_EQ(s.metric_name, "bytes_sent");
    EXPECT_EQ(s.raw_value, "4711");
    EXPECT_EQ(s.as_counter(), 4711u);
    ASSERT_EQ(transport.calls.size(), 1u);
    EXPECT_EQ(transport.calls[0], "WANCommonInterfaceConfig1#GetTotalBytesSent");
}

TEST_F(SamplerTest, MissingParameterIsSampleError) {
    transport.push_response("WANCommonInterfaceConfig1", "GetTotalBytesSent", {{"NewSomethingElse", "1"}});

    try {
        sampler.sample(make_spec("bytes_sent", MetricKind::Counter));
        FAIL() << "expected SampleError";
    } catch (const SampleError& e) {
        EXPECT_EQ(e.metric_name(), "bytes_sent");
        EXPECT_NE(std::string(e.what()).find("NewTotalBytesSent"), std::string::npos);
    }
}

TEST_F(SamplerTest, TransportFailureIsSampleError) {
    transport.push_failure("WANCommonInterfaceConfig1", "GetTotalBytesSent");
    EXPECT_THROW(sampler.sample(make_spec("bytes_sent", MetricKind::Gauge)), SampleError);
}

TEST_F(SamplerTest, GaugeValuesOverwrite) {
    auto metrics = build_monitored_metrics({make_spec("signal", MetricKind::Gauge)}, registry);

    transport.push_value("WANCommonInterfaceConfig1", "GetTotalBytesSent", "NewTotalBytesSent", "-70");
    transport.push_value("WANCommonInterfaceConfig1", "GetTotalBytesSent", "NewTotalBytesSent", "-65");

    EXPECT_DOUBLE_EQ(sampler.poll(metrics[0]), -70.0);
    EXPECT_DOUBLE_EQ(registry.get_gauge("signal"), -70.0);
    EXPECT_DOUBLE_EQ(sampler.poll(metrics[0]), -65.0);
    EXPECT_DOUBLE_EQ(registry.get_gauge("signal"), -65.0);
}

TEST_F(SamplerTest, CounterValuesAreReconciled) {
    auto metrics = build_monitored_metrics({make_spec("traffic", MetricKind::Counter)}, registry);

    transport.push_value("WANCommonInterfaceConfig1", "GetTotalBytesSent", "NewTotalBytesSent", "100");
    transport.push_value("WANCommonInterfaceConfig1", "GetTotalBytesSent", "NewTotalBytesSent", "140");

    EXPECT_DOUBLE_EQ(sampler.poll(metrics[0]), 100.0);
    EXPECT_DOUBLE_EQ(sampler.poll(metrics[0]), 40.0);
    EXPECT_DOUBLE_EQ(registry.get_counter("traffic"), 140.0);
    EXPECT_EQ(std::get<CounterExport>(metrics[0].exported).state.last_raw_value, 140u);
}

TEST_F(SamplerTest, NonNumericValueLeavesStateUntouched) {
    auto metrics = build_monitored_metrics({make_spec("traffic", MetricKind::Counter)}, registry);

    transport.push_value("WANCommonInterfaceConfig1", "GetTotalBytesSent", "NewTotalBytesSent", "100");
    transport.push_value("WANCommonInterfaceConfig1", "GetTotalBytesSent", "NewTotalBytesSent", "Up");
    transport.push_value("WANCommonInterfaceConfig1", "GetTotalBytesSent", "NewTotalBytesSent", "-5");

    sampler.poll(metrics[0]);
    EXPECT_THROW(sampler.poll(metrics[0]), SampleError);
    EXPECT_THROW(sampler.poll(metrics[0]), SampleError);

    EXPECT_EQ(std::get<CounterExport>(metrics[0].exported).state.last_raw_value, 100u);
    EXPECT_DOUBLE_EQ(registry.get_counter("traffic"), 100.0);
}

TEST(SampleTest, Conversions) {
    Sample s{"m", " 42 ", {}};
    EXPECT_DOUBLE_EQ(s.as_gauge(), 42.0);
    EXPECT_EQ(s.as_counter(), 42u);

    Sample negative{"m", "-80", {}};
    EXPECT_DOUBLE_EQ(negative.as_gauge(), -80.0);
    EXPECT_THROW(negative.as_counter(), SampleError);

    Sample fractional{"m", "1.5", {}};
    EXPECT_DOUBLE_EQ(fractional.as_gauge(), 1.5);
    EXPECT_THROW(fractional.as_counter(), SampleError);

    Sample big{"m", "18446744073709551615", {}};
    EXPECT_EQ(big.as_counter(), 18446744073709551615ull);

    Sample too_big{"m", "18446744073709551616", {}};
    EXPECT_THROW(too_big.as_counter(), SampleError);

    Sample empty{"m", "", {}};
    EXPECT_THROW(empty.as_gauge(), SampleError);
    EXPECT_THROW(empty.as_counter(), SampleError);

    Sample text{"m", "Connected", {}};
    EXPECT_THROW(text.as_gauge(), SampleError);
}
