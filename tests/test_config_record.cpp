#include <catch2/catch_test_macros.hpp>

#include "config_record.hpp"

#include <limits>

namespace {

ConfigRecord valid_record() {
    ConfigRecord r = ConfigRecord::builtin_defaults();
    r.api_key = "sk-test";
    return r;
}

} // namespace

TEST_CASE("ConfigRecord", "[record]") {

    SECTION("DefaultValues") {
        auto r = ConfigRecord::builtin_defaults();
        REQUIRE(r.api_key.empty());
        REQUIRE(r.endpoint == "https://api.openai.com");
        REQUIRE(r.model == "gpt-3.5-turbo");
        REQUIRE(r.max_tokens == 2048);
        REQUIRE(r.temperature == 0.7);
        REQUIRE(r.top_p == 1.0);
        REQUIRE(r.frequency_penalty == 0.0);
        REQUIRE(r.presence_penalty == 0.0);
        REQUIRE_FALSE(r.stop_sequence.has_value());
        REQUIRE(r.timeout_seconds == 30.0);
        REQUIRE_FALSE(r.organization.has_value());
    }

    SECTION("ValidRecordPasses") {
        REQUIRE(valid_record().validate().has_value());
    }

    SECTION("EmptyKeyIsMissingCredential") {
        auto res = ConfigRecord::builtin_defaults().validate();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ConfigErrc::MissingCredential);
    }

    SECTION("TemperatureOutOfRange") {
        auto r = valid_record();
        r.temperature = 3.5;
        auto res = r.validate();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ConfigErrc::OutOfRange);
        REQUIRE(res.error().field == "temperature");
        REQUIRE(res.error().describe().find("3.5") != std::string::npos);
    }

    SECTION("RangeBoundsAreInclusive") {
        auto r = valid_record();
        r.temperature = 2.0;
        r.top_p = 0.0;
        r.frequency_penalty = -2.0;
        r.presence_penalty = 2.0;
        REQUIRE(r.validate().has_value());
    }

    SECTION("EachBoundedFieldIsChecked") {
        auto check = [](auto mutate, const char* field) {
            auto r = valid_record();
            mutate(r);
            auto res = r.validate();
            REQUIRE_FALSE(res.has_value());
            REQUIRE(res.error().code == ConfigErrc::OutOfRange);
            REQUIRE(res.error().field == field);
        };
        check([](ConfigRecord& r) { r.max_tokens = 0; }, "max_tokens");
        check([](ConfigRecord& r) { r.max_tokens = -5; }, "max_tokens");
        check([](ConfigRecord& r) { r.top_p = 1.01; }, "top_p");
        check([](ConfigRecord& r) { r.frequency_penalty = -2.5; }, "frequency_penalty");
        check([](ConfigRecord& r) { r.presence_penalty = 2.5; }, "presence_penalty");
        check([](ConfigRecord& r) { r.timeout_seconds = 0.0; }, "timeout_seconds");
        check([](ConfigRecord& r) {
            r.timeout_seconds = std::numeric_limits<double>::infinity();
        }, "timeout_seconds");
    }

    SECTION("NaNIsOutOfRange") {
        auto r = valid_record();
        r.top_p = std::numeric_limits<double>::quiet_NaN();
        auto res = r.validate();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().field == "top_p");
    }

    SECTION("CredentialCheckedBeforeRanges") {
        auto r = ConfigRecord::builtin_defaults();
        r.temperature = 9.0;
        REQUIRE(r.validate().error().code == ConfigErrc::MissingCredential);
    }

    SECTION("EndpointMustBeHttp") {
        auto r = valid_record();
        r.endpoint = "ftp://example.com";
        auto res = r.validate();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ConfigErrc::InvalidValue);
        REQUIRE(res.error().field == "endpoint");
    }

    SECTION("InvalidUtf8Rejected") {
        auto r = valid_record();
        r.api_key = "sk-\xff\xfe";
        auto res = r.validate();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ConfigErrc::InvalidValue);
        REQUIRE(res.error().field == "api_key");

        r = valid_record();
        r.stop_sequence = "\xff";
        REQUIRE(r.validate().error().field == "stop_sequence");

        r = valid_record();
        r.stop_sequence = "caf\xc3\xa9";
        REQUIRE(r.validate().has_value());
    }

    SECTION("EmptyModelRejected") {
        auto r = valid_record();
        r.model.clear();
        REQUIRE(r.validate().error().field == "model");
    }

    SECTION("CompletionsUrl") {
        auto r = valid_record();
        REQUIRE(r.completions_url() == "https://api.openai.com/v1/chat/completions");
        r.endpoint = "http://localhost:8080/";
        REQUIRE(r.completions_url() == "http://localhost:8080/v1/chat/completions");
    }

    SECTION("StructuralEquality") {
        auto a = valid_record();
        auto b = valid_record();
        REQUIRE(a == b);
        b.stop_sequence = "\n";
        REQUIRE_FALSE(a == b);
    }

    SECTION("PartialConfigEmpty") {
        PartialConfig p;
        REQUIRE(p.empty());
        p.timeout_seconds = 5.0;
        REQUIRE_FALSE(p.empty());
    }
}

TEST_CASE("ConfigError descriptions", "[record]") {

    SECTION("FileErrorsNamePath") {
        auto e = ConfigError::invalid_format("/tmp/x.json", "bad", "max_tokens");
        auto msg = e.describe();
        REQUIRE(msg.find("/tmp/x.json") != std::string::npos);
        REQUIRE(msg.find("max_tokens") != std::string::npos);
    }

    SECTION("MissingCredentialMentionsSources") {
        auto msg = ConfigError::missing_credential().describe();
        REQUIRE(msg.find("OPENAI_API_KEY") != std::string::npos);
    }
}
