#include <catch2/catch_test_macros.hpp>

#include <mcn_ls/lsp/document_store.hpp>

using namespace mcn_ls;

namespace {

Document MakeDocument(const char* uri, int64_t version, const char* text) {
    return Document{DocumentUri::Create(uri).Value(), text, version, "mcn-16"};
}

} // anonymous namespace

TEST_CASE("DocumentStore: starts empty", "[lsp][documents]") {
    DocumentStore store;
    CHECK_FALSE(store.Current().has_value());
}

TEST_CASE("DocumentStore: first document is always accepted", "[lsp][documents]") {
    DocumentStore store;
    CHECK(store.Replace(MakeDocument("file:///a.mcn", -5, "pass")));
    REQUIRE(store.Current().has_value());
    CHECK(store.Current()->version == -5);
}

TEST_CASE("DocumentStore: newer version replaces", "[lsp][documents]") {
    DocumentStore store;
    store.Replace(MakeDocument("file:///a.mcn", 1, "pass"));
    CHECK(store.Replace(MakeDocument("file:///a.mcn", 2, "debug")));
    CHECK(store.Current()->text == "debug");
}

TEST_CASE("DocumentStore: equal or older version is rejected", "[lsp][documents]") {
    DocumentStore store;
    store.Replace(MakeDocument("file:///a.mcn", 3, "three"));
    CHECK_FALSE(store.Replace(MakeDocument("file:///a.mcn", 3, "again")));
    CHECK_FALSE(store.Replace(MakeDocument("file:///a.mcn", 1, "one")));
    CHECK(store.Current()->text == "three");
    CHECK(store.Current()->version == 3);
}

TEST_CASE("DocumentStore: versions are compared across uris", "[lsp][documents]") {
    DocumentStore store;
    store.Replace(MakeDocument("file:///a.mcn", 4, "a"));
    CHECK_FALSE(store.Replace(MakeDocument("file:///b.mcn", 2, "b")));
    CHECK(store.Replace(MakeDocument("file:///b.mcn", 5, "b")));
    CHECK(store.Current()->uri.Value() == "file:///b.mcn");
}
