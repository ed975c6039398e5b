/**
 * @file test_security_config.cpp
 * @brief Unit tests for validation and filesystem safety helpers
 *
 * Tests security configuration including:
 * - Identifier and display name validation
 * - Filename sanitization against traversal
 * - Collision-free destination names
 * - Receive directory resolution
 * - Path containment checks
 */

#include <gtest/gtest.h>
#include "meshpulse/security_config.hpp"
#include "test_support.hpp"

#include <cstdlib>

using namespace meshpulse;
using namespace meshpulse::security;
using namespace meshpulse::testing_support;

class SecurityConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("MESHPULSE_RECEIVE_DIR");
    }
};

// ============================================================================
// Constants
// ============================================================================

TEST_F(SecurityConfigTest, DefaultsMatchProtocol) {
    EXPECT_EQ(DISCOVERY_PORT, 37020);
    EXPECT_EQ(TRANSFER_PORT, 5000);
    EXPECT_EQ(CHUNK_SIZE, 64u * 1024u);
    EXPECT_EQ(SESSION_SEED_SIZE, 32u);
    EXPECT_LT(PEER_STALE_AFTER, PEER_EXPIRE_AFTER);
    EXPECT_LT(ANNOUNCE_INTERVAL, PEER_EXPIRE_AFTER);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(SecurityConfigTest, ValidateIdentifier) {
    EXPECT_TRUE(validate_identifier("host-a_1.local"));
    EXPECT_FALSE(validate_identifier(""));
    EXPECT_FALSE(validate_identifier("has space"));
    EXPECT_FALSE(validate_identifier("slash/inside"));
    EXPECT_FALSE(validate_identifier(std::string(MAX_IDENTIFIER_LENGTH + 1, 'a')));
}

TEST_F(SecurityConfigTest, ValidateDisplayName) {
    EXPECT_TRUE(validate_display_name("Alice's Laptop"));
    EXPECT_FALSE(validate_display_name(""));
    EXPECT_FALSE(validate_display_name("tab\there"));
    EXPECT_FALSE(validate_display_name(std::string(MAX_DISPLAY_NAME_LENGTH + 1, 'n')));
}

// ============================================================================
// Filename Sanitization
// ============================================================================

TEST_F(SecurityConfigTest, SanitizeStripsDirectories) {
    EXPECT_EQ(sanitize_filename("../../etc/passwd"), "passwd");
    EXPECT_EQ(sanitize_filename("/absolute/path/report.pdf"), "report.pdf");
    EXPECT_EQ(sanitize_filename("..\\..\\windows\\system.ini"), "system.ini");
}

TEST_F(SecurityConfigTest, SanitizeRejectsDotNames) {
    EXPECT_EQ(sanitize_filename(".."), "untitled");
    EXPECT_EQ(sanitize_filename("."), "untitled");
    EXPECT_EQ(sanitize_filename("dir/"), "untitled");
    EXPECT_EQ(sanitize_filename(""), "untitled");
    EXPECT_EQ(sanitize_filename(".hidden"), "hidden");
}

TEST_F(SecurityConfigTest, SanitizeReplacesReservedAndControlCharacters) {
    EXPECT_EQ(sanitize_filename("a<b>c:d.txt"), "a_b_c_d.txt");
    EXPECT_EQ(sanitize_filename(std::string("nul\0byte.txt", 12)), "nulbyte.txt");
    EXPECT_EQ(sanitize_filename("  spaced.txt  "), "spaced.txt");
}

TEST_F(SecurityConfigTest, SanitizeTruncatesKeepingExtension) {
    std::string long_name = std::string(400, 'x') + ".tar";
    std::string sanitized = sanitize_filename(long_name);
    EXPECT_EQ(sanitized.size(), MAX_FILENAME_LENGTH);
    EXPECT_EQ(sanitized.substr(sanitized.size() - 4), ".tar");
}

TEST_F(SecurityConfigTest, SanitizeIdentifier) {
    EXPECT_EQ(sanitize_identifier("My Host.local"), "my-host.local");
    EXPECT_EQ(sanitize_identifier(""), "peer");
    EXPECT_LE(sanitize_identifier(std::string(100, 'h')).size(), MAX_IDENTIFIER_LENGTH - 10);
    EXPECT_TRUE(validate_identifier(sanitize_identifier("weird!@#name")));
}

// ============================================================================
// Destinations
// ============================================================================

TEST_F(SecurityConfigTest, UniqueDestinationAddsCounter) {
    TempDir dir;

    EXPECT_EQ(unique_destination(dir.path(), "photo.jpg"), dir / "photo.jpg");

    write_file(dir / "photo.jpg", {1});
    EXPECT_EQ(unique_destination(dir.path(), "photo.jpg"), dir / "photo (1).jpg");

    write_file(dir / "photo (1).jpg", {2});
    EXPECT_EQ(unique_destination(dir.path(), "photo.jpg"), dir / "photo (2).jpg");
}

TEST_F(SecurityConfigTest, ReceiveDirectoryPrefersConfiguredValue) {
    TempDir dir;
    auto configured = dir / "inbox";
    setenv("MESHPULSE_RECEIVE_DIR", (dir / "from-env").string().c_str(), 1);

    auto resolved = get_receive_directory(configured.string());
    EXPECT_EQ(resolved, configured);
    EXPECT_TRUE(std::filesystem::is_directory(configured));
}

TEST_F(SecurityConfigTest, ReceiveDirectoryFromEnvironment) {
    TempDir dir;
    auto from_env = dir / "from-env";
    setenv("MESHPULSE_RECEIVE_DIR", from_env.string().c_str(), 1);

    EXPECT_EQ(get_receive_directory(), from_env);
    EXPECT_TRUE(std::filesystem::is_directory(from_env));
}

TEST_F(SecurityConfigTest, IsSafePath) {
    TempDir dir;
    EXPECT_TRUE(is_safe_path(dir / "file.txt", dir.path()));
    EXPECT_FALSE(is_safe_path(dir / ".." / "escape.txt", dir.path()));
    EXPECT_FALSE(is_safe_path(dir.path(), dir.path()));
}

TEST_F(SecurityConfigTest, IsSafePathFollowsSymlinks) {
    TempDir dir;
    auto base = dir / "inbox";
    auto outside = dir / "outside";
    std::filesystem::create_directories(base);
    std::filesystem::create_directories(outside);
    std::filesystem::create_directory_symlink(outside, base / "linked");

    EXPECT_FALSE(is_safe_path(base / "linked" / "file.txt", base));
    EXPECT_TRUE(is_safe_path(base / "plain.txt", base));
}
