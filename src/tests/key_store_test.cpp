#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include "crypto/key_store.hpp"
#include "test_utils.hpp"

using namespace dbridge::crypto;

class KeyStoreTest : public ::testing::Test {
protected:
    dbridge::test::TempDir temp_dir;
    std::filesystem::path key_path;

    void SetUp() override {
        key_path = temp_dir.path() / "config" / ".key";
    }

    void write_raw_key(size_t size) {
        std::filesystem::create_directories(key_path.parent_path());
        std::ofstream file(key_path, std::ios::binary);
        std::string bytes(size, '\x07');
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }
};

TEST_F(KeyStoreTest, GeneratesKeyWhenAbsent) {
    KeyStore store(key_path);
    SymmetricKey key = store.ensure_key();

    EXPECT_EQ(key.size(), KeyStore::KEY_SIZE);
    ASSERT_TRUE(std::filesystem::exists(key_path));
    EXPECT_EQ(std::filesystem::file_size(key_path), KeyStore::KEY_SIZE);
}

TEST_F(KeyStoreTest, ReturnsSameKeyOnEveryCall) {
    KeyStore store(key_path);
    SymmetricKey first = store.ensure_key();
    SymmetricKey second = store.ensure_key();
    EXPECT_EQ(first, second);

    // A fresh instance on the same path reads the persisted key
    KeyStore reopened(key_path);
    EXPECT_EQ(reopened.ensure_key(), first);
}

TEST_F(KeyStoreTest, GeneratedKeyIsOwnerOnly) {
    KeyStore store(key_path);
    store.ensure_key();

    using std::filesystem::perms;
    perms mode = std::filesystem::status(key_path).permissions();
    EXPECT_EQ(mode & perms::all, perms::owner_read | perms::owner_write);
}

TEST_F(KeyStoreTest, WrongSizeKeyFileIsCorrupt) {
    write_raw_key(10);
    KeyStore store(key_path);

    EXPECT_THROW(store.ensure_key(), KeyCorruptError);
    // The corrupt file is left for the operator to inspect
    EXPECT_EQ(std::filesystem::file_size(key_path), 10u);
}

TEST_F(KeyStoreTest, CorruptKeyIsAKeyStoreError) {
    write_raw_key(KeyStore::KEY_SIZE + 1);
    KeyStore store(key_path);

    EXPECT_THROW(store.ensure_key(), KeyStoreError);
}

TEST_F(KeyStoreTest, ExistingValidKeyIsReadBack) {
    write_raw_key(KeyStore::KEY_SIZE);
    KeyStore store(key_path);

    SymmetricKey key = store.ensure_key();
    EXPECT_EQ(key, SymmetricKey(KeyStore::KEY_SIZE, 0x07));
}

TEST_F(KeyStoreTest, DirectoryAtKeyPathIsRejected) {
    std::filesystem::create_directories(key_path);
    KeyStore store(key_path);

    EXPECT_THROW(store.ensure_key(), KeyStoreError);
}

TEST_F(KeyStoreTest, DistinctStoresGenerateDistinctKeys) {
    KeyStore a(temp_dir.path() / "a" / ".key");
    KeyStore b(temp_dir.path() / "b" / ".key");

    EXPECT_NE(a.ensure_key(), b.ensure_key());
}

TEST(KeyStorePathTest, KeyLivesBesideConfig) {
    EXPECT_EQ(KeyStore::path_for_config("./config/leviton.json"), std::filesystem::path("./config/.key"));
    EXPECT_EQ(KeyStore::path_for_config("/etc/bridge/settings.json"), std::filesystem::path("/etc/bridge/.key"));
}
