#include <gtest/gtest.h>
#include "runtime/ambient.hpp"
#include "runtime/capabilities.hpp"
#include "runtime/file_store.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <limits>

using namespace warden::runtime;
using warden::audit::ViolationCode;
using warden::audit::ViolationEvent;
using warden::policy::PolicyConfig;

namespace fs = std::filesystem;

namespace {

PolicyConfig make_policy() {
    PolicyConfig policy;
    policy.allowed_read_paths = {"/allowed"};
    policy.virtual_files = {
        {"/allowed/config.json", "{\"ok\":true}"},
        {"/allowed/nested/data.txt", "data"},
        {"/blocked/secret.env", "TOKEN=1"},
    };
    policy.network_allowlist = {"api.example.com", "*.cdn.example.com"};
    policy.memory_soft_limit = 1000;
    return policy;
}

class CapabilitiesTest : public ::testing::Test {
protected:
    std::vector<ViolationEvent> recorded;
    std::unique_ptr<PolicyCapabilities> caps;

    void SetUp() override {
        caps = std::make_unique<PolicyCapabilities>(make_policy(), nullptr,
            [this](const ViolationEvent& e) { recorded.push_back(e); });
    }

    // Runs `call`, expects a CapabilityError with `code`, and the matching violation
    template <typename Call>
    void expect_denied(Call call, ViolationCode code) {
        size_t before = recorded.size();
        try {
            call();
            FAIL() << "expected CapabilityError";
        } catch (const CapabilityError& e) {
            ASSERT_TRUE(e.code().has_value());
            EXPECT_EQ(*e.code(), code);
        }
        ASSERT_EQ(recorded.size(), before + 1);
        EXPECT_EQ(recorded.back().code, code);
    }
};

} // namespace

TEST_F(CapabilitiesTest, ReadsAllowedFile) {
    EXPECT_EQ(caps->read_file("/allowed/config.json"), "{\"ok\":true}");
    EXPECT_EQ(caps->read_file("//allowed/./nested/../config.json"), "{\"ok\":true}");
    EXPECT_TRUE(recorded.empty());
}

TEST_F(CapabilitiesTest, MissingAllowedFileIsNotAViolation) {
    try {
        caps->read_file("/allowed/missing.txt");
        FAIL() << "expected CapabilityError";
    } catch (const CapabilityError& e) {
        EXPECT_FALSE(e.code().has_value());
    }
    EXPECT_TRUE(recorded.empty());
}

TEST_F(CapabilitiesTest, ReadOutsideAllowlistIsDenied) {
    expect_denied([this] { caps->read_file("/blocked/secret.env"); }, ViolationCode::FS_DENIED);
    expect_denied([this] { caps->read_file("/allowedX/config.json"); }, ViolationCode::FS_DENIED);
    EXPECT_EQ(recorded[0].metadata->at("normalized"), "/blocked/secret.env");
}

TEST_F(CapabilitiesTest, TraversalEscapingAllowlistIsFlagged) {
    expect_denied([this] { caps->read_file("/allowed/../blocked/secret.env"); },
                  ViolationCode::FS_TRAVERSAL);
    expect_denied([this] { caps->read_file("/allowed/%2e%2e/blocked/secret.env"); },
                  ViolationCode::FS_TRAVERSAL);
    expect_denied([this] { caps->read_file("/allowed/%252e%252e/blocked/secret.env"); },
                  ViolationCode::FS_TRAVERSAL);
    expect_denied([this] { caps->read_file("\\allowed\\..\\blocked\\secret.env"); },
                  ViolationCode::FS_TRAVERSAL);
}

TEST_F(CapabilitiesTest, TraversalStayingInsideAllowlistIsAllowed) {
    EXPECT_EQ(caps->read_file("/allowed/nested/../config.json"), "{\"ok\":true}");
    EXPECT_TRUE(recorded.empty());
}

TEST_F(CapabilitiesTest, NulAndMalformedPathsAreDenied) {
    expect_denied([this] { caps->read_file(std::string("/allowed/config.json\0.txt", 25)); },
                  ViolationCode::FS_DENIED);
    expect_denied([this] { caps->read_file("/allowed/%zzconfig.json"); },
                  ViolationCode::FS_DENIED);
}

TEST_F(CapabilitiesTest, ListFilesIsSortedAndNeverAViolation) {
    auto allowed = caps->list_files("/allowed");
    EXPECT_EQ(allowed, (std::vector<std::string>{
        "/allowed/config.json", "/allowed/nested/data.txt"}));

    auto relative = caps->list_files("allowed/nested");
    EXPECT_EQ(relative, (std::vector<std::string>{"/allowed/nested/data.txt"}));

    EXPECT_TRUE(caps->list_files("/nothing").empty());
    EXPECT_TRUE(recorded.empty());
}

TEST_F(CapabilitiesTest, ListFilesHidesPathsOutsideAllowlist) {
    EXPECT_TRUE(caps->list_files("/blocked").empty());
    EXPECT_EQ(caps->list_files("/"), (std::vector<std::string>{
        "/allowed/config.json", "/allowed/nested/data.txt"}));
    EXPECT_TRUE(recorded.empty());
}

TEST_F(CapabilitiesTest, FetchAllowedHost) {
    auto response = caps->fetch("https://API.example.com/v1/items?x=1");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.host, "api.example.com");
    EXPECT_EQ(response.url, "https://API.example.com/v1/items?x=1");

    EXPECT_EQ(caps->fetch("https://img.cdn.example.com/a.png").status, 200);
    EXPECT_TRUE(recorded.empty());
}

TEST_F(CapabilitiesTest, FetchDeniedHost) {
    expect_denied([this] { caps->fetch("https://evil.com/"); }, ViolationCode::NET_DENIED);
    expect_denied([this] { caps->fetch("https://cdn.example.com/"); }, ViolationCode::NET_DENIED);
    expect_denied([this] { caps->fetch("https://api.example.com.evil.net/"); },
                  ViolationCode::NET_DENIED);
    expect_denied([this] { caps->fetch("not a url"); }, ViolationCode::NET_DENIED);
    EXPECT_EQ(recorded[0].metadata->at("host"), "evil.com");
}

TEST_F(CapabilitiesTest, AllocTracksCumulativeTotal) {
    EXPECT_EQ(caps->alloc(400), 400u);
    EXPECT_EQ(caps->alloc(600), 1000u);
    EXPECT_TRUE(recorded.empty());

    expect_denied([this] { caps->alloc(1); }, ViolationCode::MEMORY_SOFT_LIMIT);
    EXPECT_EQ(caps->allocated(), 1001u);
    EXPECT_EQ(recorded.back().metadata->at("limit"), 1000);
}

TEST(CapabilitiesAllocTest, SaturatesWithoutLimit) {
    PolicyCapabilities caps(PolicyConfig{}, nullptr, nullptr);
    caps.alloc(std::numeric_limits<uint64_t>::max() - 1);
    EXPECT_EQ(caps.alloc(10), std::numeric_limits<uint64_t>::max());
}

TEST(CapabilitiesCancelTest, CancelledRunAbortsWithoutViolations) {
    std::vector<ViolationEvent> recorded;
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    PolicyCapabilities caps(make_policy(), nullptr,
        [&recorded](const ViolationEvent& e) { recorded.push_back(e); },
        [cancelled] { return cancelled->load(); });

    EXPECT_EQ(caps.read_file("/allowed/config.json"), "{\"ok\":true}");
    *cancelled = true;

    EXPECT_THROW(caps.read_file("/blocked/secret.env"), RunAborted);
    EXPECT_THROW(caps.fetch("https://evil.com"), RunAborted);
    EXPECT_THROW(caps.alloc(1), RunAborted);
    EXPECT_THROW(caps.list_files("/"), RunAborted);
    EXPECT_TRUE(recorded.empty());
}

TEST(AmbientTest, GuardsOutsideSandboxThrowLogicError) {
    EXPECT_FALSE(ambient::in_sandbox());
    EXPECT_THROW(ambient::eval("1 + 1"), std::logic_error);
    EXPECT_THROW(ambient::compile_function({"a"}, "return a"), std::logic_error);
}

TEST(AmbientTest, GuardsInsideScopeRecordDynamicCode) {
    std::vector<ViolationEvent> recorded;
    PolicyCapabilities caps(make_policy(), nullptr,
        [&recorded](const ViolationEvent& e) { recorded.push_back(e); });

    {
        AmbientScope scope(&caps);
        EXPECT_TRUE(ambient::in_sandbox());

        try {
            ambient::eval("process.exit()");
            FAIL() << "expected CapabilityError";
        } catch (const CapabilityError& e) {
            EXPECT_EQ(e.code(), ViolationCode::DYNAMIC_CODE);
        }
        EXPECT_THROW(ambient::compile_function({"a", "b"}, "return a + b"), CapabilityError);
    }

    EXPECT_FALSE(ambient::in_sandbox());
    ASSERT_EQ(recorded.size(), 2u);
    EXPECT_EQ(recorded[0].code, ViolationCode::DYNAMIC_CODE);
    EXPECT_EQ(recorded[0].severity, warden::audit::Severity::HIGH);
    EXPECT_EQ(recorded[0].metadata->at("primitive"), "eval");
    EXPECT_EQ(recorded[1].metadata->at("primitive"), "compile_function");
}

TEST(FileStoreTest, VirtualStoreNormalizesKeys) {
    VirtualFileStore store({{"/a//b/./c.txt", "c"}, {"/a/d.txt", "d"}});
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.read("/a/b/c.txt"), std::optional<std::string>("c"));
    EXPECT_FALSE(store.read("/a/b").has_value());
    EXPECT_EQ(store.list("/a"), (std::vector<std::string>{"/a/b/c.txt", "/a/d.txt"}));
}

class HostFileStoreTest : public ::testing::Test {
protected:
    fs::path root;
    fs::path outside;

    void SetUp() override {
        auto base = fs::temp_directory_path() /
            ("warden_store_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
             "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(base);
        root = base / "root";
        outside = base / "outside";
        fs::create_directories(root / "allowed" / "nested");
        fs::create_directories(outside);
        write(root / "allowed" / "config.json", "{\"ok\":true}");
        write(root / "allowed" / "nested" / "data.txt", "data");
        write(outside / "secret.env", "TOKEN=1");
    }

    void TearDown() override {
        fs::remove_all(root.parent_path());
    }

    static void write(const fs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }
};

TEST_F(HostFileStoreTest, ReadsAndListsUnderRoot) {
    auto store = std::make_shared<HostFileStore>(root.string());

    EXPECT_EQ(store->read("/allowed/config.json"), std::optional<std::string>("{\"ok\":true}"));
    EXPECT_FALSE(store->read("/allowed/missing").has_value());
    EXPECT_FALSE(store->read("/allowed").has_value());
    EXPECT_EQ(store->list("/allowed"), (std::vector<std::string>{
        "/allowed/config.json", "/allowed/nested/data.txt"}));
}

TEST_F(HostFileStoreTest, RefusesSymlinkOutOfRoot) {
    std::error_code ec;
    fs::create_symlink(outside / "secret.env", root / "allowed" / "link.env", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }

    HostFileStore store(root.string());
    EXPECT_FALSE(store.read("/allowed/link.env").has_value());
}

TEST_F(HostFileStoreTest, ListingSkipsSymlinksOutOfRoot) {
    std::error_code ec;
    fs::create_symlink(outside / "secret.env", root / "allowed" / "link.env", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }
    fs::create_symlink(root / "allowed" / "config.json", root / "allowed" / "alias.json", ec);
    ASSERT_FALSE(ec) << ec.message();

    HostFileStore store(root.string());
    EXPECT_EQ(store.list("/allowed"), (std::vector<std::string>{
        "/allowed/alias.json", "/allowed/config.json", "/allowed/nested/data.txt"}));
    EXPECT_TRUE(store.list("/allowed/link.env").empty());
}

TEST_F(HostFileStoreTest, BacksPolicyCapabilities) {
    PolicyConfig policy;
    policy.allowed_read_paths = {"/allowed"};
    std::vector<ViolationEvent> recorded;
    PolicyCapabilities caps(policy, std::make_shared<HostFileStore>(root.string()),
        [&recorded](const ViolationEvent& e) { recorded.push_back(e); });

    EXPECT_EQ(caps.read_file("/allowed/nested/data.txt"), "data");
    EXPECT_THROW(caps.read_file("/allowed/../../outside/secret.env"), CapabilityError);
    ASSERT_EQ(recorded.size(), 1u);
    EXPECT_EQ(recorded[0].code, ViolationCode::FS_TRAVERSAL);
}
