#include "key_value_store.hh"

#include <boost/optional/optional_io.hpp>
#include <fstream>

#include "errors.hh"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test_helper.hh"

using namespace testing;

namespace {

std::vector<std::pair<std::string, std::string>> all_items(
    KeyValueStore& store) {
    StoreGuard guard(store);
    std::vector<std::pair<std::string, std::string>> result;
    for (const auto& item : guard->items()) {
        result.emplace_back(item.first, item.second);
    }
    return result;
}

}  // namespace

TEST(KeyValueStoreTest, WriteAndRead) {
    boost::filesystem::path root = unique_temp_path();
    StoreConfig config(root);

    {
        KeyValueStore store(config, "a", true);
        StoreGuard guard(store);
        guard->set("run", "to run=<>laufen");
        guard->set("haus", "Haus=<>house");
        guard->set("haus", "Haus {n}=<>house");
        guard->set("empty", "");
    }

    EXPECT_TRUE(boost::filesystem::exists(config.store_path("a")));
    EXPECT_FALSE(boost::filesystem::exists(config.store_path("b")));

    {
        KeyValueStore store(config, "a");
        StoreGuard guard(store);
        EXPECT_EQ(guard->get("run"), "to run=<>laufen");
        EXPECT_EQ(guard->get("haus"), "Haus {n}=<>house");
        EXPECT_EQ(guard->get("empty"), "");
        EXPECT_EQ(guard->get("missing", "fallback"), "fallback");
        EXPECT_EQ(guard->find("missing"), boost::none);
        EXPECT_EQ(guard->find("run"),
                  boost::optional<std::string>("to run=<>laufen"));
        EXPECT_THROW(guard->get("missing"), NotFoundError);
    }

    KeyValueStore store(config, "a");
    EXPECT_THAT(all_items(store),
                UnorderedElementsAre(Pair("run", "to run=<>laufen"),
                                     Pair("haus", "Haus {n}=<>house"),
                                     Pair("empty", "")));
    EXPECT_EQ(store.size(), 3);
    EXPECT_FALSE(store.is_open());

    boost::filesystem::remove_all(root);
}

TEST(KeyValueStoreTest, ImportingStartsEmpty) {
    boost::filesystem::path root = unique_temp_path();
    StoreConfig config(root);

    {
        KeyValueStore store(config, "a", true);
        StoreGuard guard(store);
        guard->set("old", "value");
    }
    {
        KeyValueStore store(config, "a", true);
        StoreGuard guard(store);
        EXPECT_EQ(guard->find("old"), boost::none);
        guard->set("new", "value");
    }

    KeyValueStore store(config, "a");
    EXPECT_THAT(all_items(store), ElementsAre(Pair("new", "value")));

    boost::filesystem::remove_all(root);
}

TEST(KeyValueStoreTest, NestedAcquireSharesOneHandle) {
    boost::filesystem::path root = unique_temp_path();
    StoreConfig config(root);

    KeyValueStore store(config, "a", true);
    EXPECT_FALSE(store.is_open());
    {
        StoreGuard outer(store);
        outer->set("key", "value");
        {
            StoreGuard inner(store);
            EXPECT_EQ(inner->get("key"), "value");
            inner->set("other", "value");
        }
        // Only the outermost release writes the file
        EXPECT_TRUE(store.is_open());
        EXPECT_FALSE(boost::filesystem::exists(config.store_path("a")));
        EXPECT_EQ(outer->size(), 2);
        EXPECT_TRUE(store.is_open());
    }
    EXPECT_FALSE(store.is_open());
    EXPECT_TRUE(boost::filesystem::exists(config.store_path("a")));

    KeyValueStore reader(config, "a");
    EXPECT_EQ(reader.size(), 2);

    boost::filesystem::remove_all(root);
}

TEST(KeyValueStoreTest, ExplicitAcquireRelease) {
    boost::filesystem::path root = unique_temp_path();
    StoreConfig config(root);

    KeyValueStore store(config, "a", true);
    EXPECT_THROW(store.get("key"), std::runtime_error);
    EXPECT_THROW(store.release(), std::runtime_error);

    store.acquire();
    store.set("key", "value");
    store.release();
    EXPECT_THROW(store.set("key", "value"), std::runtime_error);

    KeyValueStore reader(config, "a");
    reader.acquire();
    EXPECT_EQ(reader.get("key"), "value");
    reader.release();

    boost::filesystem::remove_all(root);
}

TEST(KeyValueStoreTest, ExceptionDiscardsPendingWrites) {
    boost::filesystem::path root = unique_temp_path();
    StoreConfig config(root);

    KeyValueStore store(config, "a", true);
    EXPECT_THROW(
        {
            StoreGuard guard(store);
            guard->set("key", "value");
            throw std::runtime_error("abort");
        },
        std::runtime_error);

    EXPECT_FALSE(store.is_open());
    EXPECT_FALSE(boost::filesystem::exists(config.store_path("a")));

    boost::filesystem::remove_all(root);
}

TEST(KeyValueStoreTest, MissingRoot) {
    boost::filesystem::path root = unique_temp_path();
    StoreConfig config(root);

    EXPECT_THROW(KeyValueStore(config, "a"), StoreMissingError);
    EXPECT_FALSE(boost::filesystem::exists(root));

    // Importing creates the root
    KeyValueStore store(config, "a", true);
    EXPECT_TRUE(boost::filesystem::is_directory(root));

    boost::filesystem::remove_all(root);
}

TEST(KeyValueStoreTest, MissingFileIsEmpty) {
    boost::filesystem::path root = unique_temp_path();
    boost::filesystem::create_directories(root);
    StoreConfig config(root);

    KeyValueStore store(config, "a");
    EXPECT_EQ(store.size(), 0);
    EXPECT_FALSE(boost::filesystem::exists(config.store_path("a")));

    boost::filesystem::remove_all(root);
}

TEST(KeyValueStoreTest, CorruptFile) {
    boost::filesystem::path root = unique_temp_path();
    boost::filesystem::create_directories(root);
    StoreConfig config(root);

    {
        std::ofstream output(config.store_path("a").string());
        output << "abc";
    }
    {
        std::ofstream output(config.store_path("b").string(),
                             std::ios_base::binary);
        uint64_t table_offset = 1000;
        output.write(reinterpret_cast<const char*>(&table_offset),
                     sizeof(table_offset));
    }

    KeyValueStore a(config, "a");
    EXPECT_THROW(a.acquire(), DecodeError);
    EXPECT_FALSE(a.is_open());

    KeyValueStore b(config, "b");
    EXPECT_THROW(b.size(), DecodeError);

    boost::filesystem::remove_all(root);
}

TEST(KeyValueStoreTest, InvalidUtf8IsRejectedOnWrite) {
    boost::filesystem::path root = unique_temp_path();
    StoreConfig config(root);

    {
        KeyValueStore store(config, "a", true);
        StoreGuard guard(store);
        EXPECT_THROW(guard->set("key", "bad \xFF value"), DecodeError);
        EXPECT_THROW(guard->set("bad \xFF key", "value"), DecodeError);
        guard->set("good", "value");
    }

    KeyValueStore store(config, "a");
    EXPECT_THAT(all_items(store), ElementsAre(Pair("good", "value")));

    boost::filesystem::remove_all(root);
}

TEST(KeyValueStoreTest, InvalidUtf8OnlyFailsItsOwnKey) {
    boost::filesystem::path root = unique_temp_path();
    boost::filesystem::create_directories(root);
    StoreConfig config(root);

    write_raw_store(config.store_path("a"),
                    {{"haus", "Haus=<>house"}, {"zzz", "\xFF\xFE"}});

    KeyValueStore store(config, "a");
    {
        StoreGuard guard(store);
        EXPECT_EQ(guard->get("haus"), "Haus=<>house");
        EXPECT_EQ(guard->find("missing"), boost::none);
        EXPECT_THROW(guard->get("zzz"), DecodeError);
        EXPECT_THROW(guard->items(), DecodeError);
    }
    // Counting never reads values
    EXPECT_EQ(store.size(), 2);

    write_raw_store(config.store_path("b"), {{"bad \xFF key", "value"}});
    KeyValueStore b(config, "b");
    EXPECT_THROW(b.size(), DecodeError);

    boost::filesystem::remove_all(root);
}

TEST(KeyValueStoreTest, UpdatingAnExistingStoreKeepsOtherKeys) {
    boost::filesystem::path root = unique_temp_path();
    boost::filesystem::create_directories(root);
    StoreConfig config(root);

    write_raw_store(config.store_path("a"),
                    {{"haus", "Haus=<>house"}, {"run", "to run=<>laufen"}});

    {
        KeyValueStore store(config, "a");
        StoreGuard guard(store);
        guard->set("run", "run=<>der Lauf");
        guard->set("baum", "Baum=<>tree");
    }

    KeyValueStore store(config, "a");
    EXPECT_THAT(all_items(store),
                UnorderedElementsAre(Pair("haus", "Haus=<>house"),
                                     Pair("run", "run=<>der Lauf"),
                                     Pair("baum", "Baum=<>tree")));

    boost::filesystem::remove_all(root);
}
