// tests/MetaClientTests.cpp
#include <Piston/FetchError.hpp>
#include <Piston/HttpManager.hpp>
#include <Piston/MetaClient.hpp>
#include <Piston/Types/Library.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <string>

using namespace Piston;

namespace {
const std::string kUrl = "https://piston-meta.mojang.com/mc/game/version_manifest_v2.json";

cpr::Response responseWith(cpr::ErrorCode code, long status, const std::string& text = "") {
    cpr::Response response;
    response.error.code = code;
    response.error.message = code == cpr::ErrorCode::OK ? "" : "could not resolve host";
    response.status_code = status;
    response.text = text;
    return response;
}

FetchError::Kind kindOf(const std::function<void()>& call) {
    try {
        call();
    } catch (const FetchError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected a FetchError";
    return FetchError::Kind::NETWORK;
}

// Every rule must allow the host, and a bare disallow matches every host
Library disallowedLibrary() {
    return Library::from_json(nlohmann::json::parse(R"({
      "name": "org.example:blocked:1.0",
      "downloads": {"artifact": {"path": "org/example/blocked-1.0.jar", "sha1": "s", "size": 1,
                                 "url": "https://libraries.minecraft.net/org/example/blocked-1.0.jar"}},
      "rules": [{"action": "disallow"}]
    })"));
}

class MetaClientOfflineTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_dataDir = std::filesystem::temp_directory_path() /
            ("piston_meta_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(m_dataDir, ec);
    }

    std::filesystem::path m_dataDir;
};
}

TEST(CheckResponseTest, TransportFailureIsNetwork) {
    cpr::Response response = responseWith(cpr::ErrorCode::UNKNOWN_ERROR, 0);
    try {
        MetaClient::checkResponse(response, kUrl);
        FAIL() << "expected a FetchError";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.kind(), FetchError::Kind::NETWORK);
        EXPECT_EQ(e.url(), kUrl);
        EXPECT_EQ(e.statusCode(), 0);
    }
}

TEST(CheckResponseTest, TransportFailureWinsOverStatus) {
    cpr::Response response = responseWith(cpr::ErrorCode::OPERATION_TIMEDOUT, 200);
    EXPECT_EQ(kindOf([&] { MetaClient::checkResponse(response, kUrl); }), FetchError::Kind::NETWORK);
}

TEST(CheckResponseTest, NonSuccessStatusIsStatus) {
    cpr::Response response = responseWith(cpr::ErrorCode::OK, 404, "Not Found");
    try {
        MetaClient::checkResponse(response, kUrl);
        FAIL() << "expected a FetchError";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.kind(), FetchError::Kind::STATUS);
        EXPECT_EQ(e.statusCode(), 404);
    }

    EXPECT_EQ(kindOf([&] { MetaClient::checkResponse(responseWith(cpr::ErrorCode::OK, 500), kUrl); }),
              FetchError::Kind::STATUS);
    EXPECT_EQ(kindOf([&] { MetaClient::checkResponse(responseWith(cpr::ErrorCode::OK, 301), kUrl); }),
              FetchError::Kind::STATUS);
}

TEST(CheckResponseTest, SuccessStatusPasses) {
    EXPECT_NO_THROW(MetaClient::checkResponse(responseWith(cpr::ErrorCode::OK, 200, "{}"), kUrl));
    EXPECT_NO_THROW(MetaClient::checkResponse(responseWith(cpr::ErrorCode::OK, 204), kUrl));
}

TEST(DecodeDocumentTest, MalformedJsonIsDecode) {
    try {
        MetaClient::decodeRootManifest("{\"latest\": ", kUrl);
        FAIL() << "expected a FetchError";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.kind(), FetchError::Kind::DECODE);
        EXPECT_EQ(e.statusCode(), 200);
        EXPECT_EQ(e.url(), kUrl);
    }
}

TEST(DecodeDocumentTest, MissingFieldIsDecode) {
    EXPECT_EQ(kindOf([] { MetaClient::decodeRootManifest(R"({"versions": []})", kUrl); }),
              FetchError::Kind::DECODE);
    EXPECT_EQ(kindOf([] { MetaClient::decodeVersionManifest(R"({"downloads": {}})", kUrl); }),
              FetchError::Kind::DECODE);
}

TEST(DecodeDocumentTest, UnknownReleaseKindIsDecode) {
    const char* body = R"({
      "latest": {"release": "1.0", "snapshot": "1.0"},
      "versions": [{"id": "1.0", "type": "nightly", "url": "u", "time": "t", "releaseTime": "t",
                    "sha1": "s", "complianceLevel": 0}]
    })";
    EXPECT_EQ(kindOf([&] { MetaClient::decodeRootManifest(body, kUrl); }), FetchError::Kind::DECODE);
}

TEST(DecodeDocumentTest, WellFormedDocumentDecodes) {
    RootManifest manifest = MetaClient::decodeRootManifest(
        R"({"latest": {"release": "1.0", "snapshot": "1.1-pre"}, "versions": []})", kUrl);
    EXPECT_EQ(manifest.latest.release, "1.0");
    EXPECT_TRUE(manifest.versions.empty());
}

TEST_F(MetaClientOfflineTest, DisallowedLibraryDownloadsNothing) {
    Config config(m_dataDir);
    HttpManager http(config);
    MetaClient client(http, config.manifestUrl);

    Library library = disallowedLibrary();
    ASSERT_FALSE(library.isAllowed());
    EXPECT_FALSE(client.downloadLibrary(library).has_value());
}

TEST_F(MetaClientOfflineTest, DisallowedLibraryStreamsNothing) {
    Config config(m_dataDir);
    HttpManager http(config);
    MetaClient client(http, config.manifestUrl);

    int chunks = 0;
    bool streamed = client.downloadLibraryStream(disallowedLibrary(),
        [&chunks](const std::string&, std::string_view) {
            ++chunks;
            return true;
        });
    EXPECT_FALSE(streamed);
    EXPECT_EQ(chunks, 0);
}
