/**
 * @file test_credential_store.cpp
 * @brief Unit tests for CredentialStore
 */

#include <gtest/gtest.h>
#include <freeprobe/core/credential_store.hpp>
#include <freeprobe/core/errors.hpp>

#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace freeprobe::core;

class CredentialStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/freeprobe_credentials_XXXXXX";
        ASSERT_NE(::mkdtemp(tmpl), nullptr);
        root_ = tmpl;
        dir_ = root_ + "/ssl";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    static Credential sample() {
        Credential credential;
        credential.appId = "fr.freebox.freeprobe";
        credential.appToken = "dyNYgfK0Ya6FWGqq83sBHa7TwzWo+pg4fDFUJHShcjVYzTfaRrZzm93p7OTAfH/0";
        credential.trackId = 42;
        credential.deviceUid = "0123456789abcdef";
        return credential;
    }

    void writeFile(const std::string& path, const std::string& content, mode_t mode) {
        {
            std::ofstream out(path);
            out << content;
        }
        ASSERT_EQ(::chmod(path.c_str(), mode), 0);
    }

    static mode_t modeOf(const std::string& path) {
        struct stat st;
        if (::stat(path.c_str(), &st) != 0) {
            return 0;
        }
        return st.st_mode & 0777;
    }

    std::string root_;
    std::string dir_;
};

TEST_F(CredentialStoreTest, SaveThenLoad) {
    CredentialStore store(dir_);
    EXPECT_FALSE(store.exists("fr.freebox.freeprobe"));

    store.save(sample());
    EXPECT_TRUE(store.exists("fr.freebox.freeprobe"));

    Credential loaded = store.load("fr.freebox.freeprobe");
    EXPECT_EQ(loaded.appId, "fr.freebox.freeprobe");
    EXPECT_EQ(loaded.appToken, sample().appToken);
    EXPECT_EQ(loaded.trackId, 42);
    EXPECT_EQ(loaded.deviceUid, "0123456789abcdef");
}

TEST_F(CredentialStoreTest, PathIsNamedAfterAppId) {
    CredentialStore store(dir_);
    EXPECT_EQ(store.pathFor("fr.freebox.freeprobe"), dir_ + "/fr.freebox.freeprobe.json");
}

TEST_F(CredentialStoreTest, FileAndDirectoryAreOwnerOnly) {
    CredentialStore store(dir_);
    store.save(sample());

    EXPECT_EQ(modeOf(dir_), 0700u);
    EXPECT_EQ(modeOf(store.pathFor("fr.freebox.freeprobe")), 0600u);
}

TEST_F(CredentialStoreTest, ExistingLooseDirectoryIsRejectedUntouched) {
    ASSERT_EQ(::mkdir(dir_.c_str(), 0755), 0);
    ASSERT_EQ(::chmod(dir_.c_str(), 0755), 0);

    CredentialStore store(dir_);
    EXPECT_THROW(store.save(sample()), ConfigError);
    EXPECT_EQ(modeOf(dir_), 0755u);
    EXPECT_FALSE(store.exists("fr.freebox.freeprobe"));
}

TEST_F(CredentialStoreTest, ExistingPrivateDirectoryIsUsed) {
    ASSERT_EQ(::mkdir(dir_.c_str(), 0700), 0);
    ASSERT_EQ(::chmod(dir_.c_str(), 0700), 0);

    CredentialStore store(dir_);
    store.save(sample());
    EXPECT_EQ(modeOf(dir_), 0700u);
    EXPECT_TRUE(store.exists("fr.freebox.freeprobe"));
}

TEST_F(CredentialStoreTest, SaveReplacesPreviousToken) {
    CredentialStore store(dir_);
    store.save(sample());

    Credential updated = sample();
    updated.appToken = "another-token";
    updated.trackId = 43;
    store.save(updated);

    Credential loaded = store.load("fr.freebox.freeprobe");
    EXPECT_EQ(loaded.appToken, "another-token");
    EXPECT_EQ(loaded.trackId, 43);
    EXPECT_FALSE(std::filesystem::exists(store.pathFor("fr.freebox.freeprobe") + ".tmp"));
}

TEST_F(CredentialStoreTest, RefusesIncompleteCredential) {
    CredentialStore store(dir_);
    Credential credential = sample();
    credential.appToken.clear();
    EXPECT_THROW(store.save(credential), ConfigError);
}

TEST_F(CredentialStoreTest, MissingFileAsksForRegistration) {
    CredentialStore store(dir_);
    try {
        store.load("fr.freebox.freeprobe");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("--register"), std::string::npos);
    }
}

TEST_F(CredentialStoreTest, RejectsGroupReadableFile) {
    CredentialStore store(dir_);
    store.save(sample());
    ASSERT_EQ(::chmod(store.pathFor("fr.freebox.freeprobe").c_str(), 0644), 0);

    EXPECT_THROW(store.load("fr.freebox.freeprobe"), ConfigError);
}

TEST_F(CredentialStoreTest, RejectsMalformedJson) {
    CredentialStore store(dir_);
    store.save(sample());
    writeFile(store.pathFor("fr.freebox.freeprobe"), "{\"app_id\": ", 0600);

    EXPECT_THROW(store.load("fr.freebox.freeprobe"), ConfigError);
}

TEST_F(CredentialStoreTest, RejectsFileOfAnotherApplication) {
    CredentialStore store(dir_);
    store.save(sample());
    writeFile(store.pathFor("fr.freebox.freeprobe"),
              R"({"app_id":"fr.freebox.other","app_token":"abc"})", 0600);

    EXPECT_THROW(store.load("fr.freebox.freeprobe"), ConfigError);
}

TEST_F(CredentialStoreTest, RejectsMissingToken) {
    CredentialStore store(dir_);
    store.save(sample());
    writeFile(store.pathFor("fr.freebox.freeprobe"), R"({"app_id":"fr.freebox.freeprobe"})", 0600);

    EXPECT_THROW(store.load("fr.freebox.freeprobe"), ConfigError);
}

TEST_F(CredentialStoreTest, AcceptsNumericTrackId) {
    CredentialStore store(dir_);
    store.save(sample());
    writeFile(store.pathFor("fr.freebox.freeprobe"),
              R"({"app_id":"fr.freebox.freeprobe","app_token":"abc","track_id":7,"unknown":1})",
              0600);

    Credential loaded = store.load("fr.freebox.freeprobe");
    EXPECT_EQ(loaded.appToken, "abc");
    EXPECT_EQ(loaded.trackId, 7);
    EXPECT_TRUE(loaded.deviceUid.empty());
}
