#include <gtest/gtest.h>
#include "obs/context.h"
#include "obs/logging.h"
#include <spdlog/sinks/ostream_sink.h>
#include <functional>
#include <sstream>

namespace {

using namespace csvsentry::obs;

auto CaptureLogLine(const std::function<void()>& emit) -> nlohmann::json {
    std::ostringstream oss;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
    auto logger = std::make_shared<spdlog::logger>("test_context", sink);
    logger->set_pattern("%v"); // Only the message
    auto old_default = spdlog::default_logger();
    spdlog::set_default_logger(logger);
    emit();
    spdlog::set_default_logger(old_default);
    return nlohmann::json::parse(oss.str());
}

TEST(ObsContextTest, LogEventIncludesContext) {
    auto j = CaptureLogLine([] {
        Context ctx;
        ctx.request_id = "req-123";
        ctx.operation = "detect";
        ctx.upload_name = "sales.csv";
        ScopedContext scope(ctx);

        LogEvent(LogLevel::Info, "test_event", "test_component", {{"extra", "val"}});
    });

    EXPECT_EQ(j["event"], "test_event");
    EXPECT_EQ(j["level"], "INFO");
    EXPECT_EQ(j["request_id"], "req-123");
    EXPECT_EQ(j["operation"], "detect");
    EXPECT_EQ(j["upload_name"], "sales.csv");
    EXPECT_EQ(j["extra"], "val");
}

TEST(ObsContextTest, ExplicitFieldsWinOverContext) {
    auto j = CaptureLogLine([] {
        Context ctx;
        ctx.request_id = "from-context";
        ScopedContext scope(ctx);
        LogEvent(LogLevel::Warn, "e", "c", {{"request_id", "explicit"}});
    });
    EXPECT_EQ(j["request_id"], "explicit");
    EXPECT_EQ(j["level"], "WARN");
}

TEST(ObsContextTest, ScopedContextNesting) {
    Context outer;
    outer.request_id = "outer";

    {
        ScopedContext s1(outer);
        EXPECT_EQ(GetContext().request_id, "outer");

        Context inner;
        inner.request_id = "inner";
        {
            ScopedContext s2(inner);
            EXPECT_EQ(GetContext().request_id, "inner");
            UpdateUploadName("inner.csv");
            EXPECT_EQ(GetContext().upload_name, "inner.csv");
        }

        EXPECT_EQ(GetContext().request_id, "outer");
        EXPECT_TRUE(GetContext().upload_name.empty());
    }

    EXPECT_FALSE(HasContext());
}

TEST(ObsContextTest, ScopedTimerStopsOnce) {
    ScopedTimer timer("stage", "test");
    double first = timer.Stop();
    double second = timer.Stop();
    EXPECT_GE(first, 0.0);
    EXPECT_EQ(first, second);
}

} // namespace
