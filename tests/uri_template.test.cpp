#include <catch2/catch_all.hpp>
#include "restbridge/core/routing/uri_template.hpp"
#include "restbridge/core/util/error_types.hpp"
#include <string>
#include <vector>

using namespace restbridge;
using nlohmann::json;

// ------------------------------------------------------------------
// 1) Path variables capture raw strings
// ------------------------------------------------------------------
TEST_CASE("Path variable captures the segment as a string", "[template]") {
    UriTemplateMatcher m("/users/{id}");

    auto r = m.matchPath("/users/42");
    REQUIRE(r);
    REQUIRE(r->get("id") == json("42"));
    REQUIRE(r->size() == 1);

    REQUIRE_FALSE(m.matchPath("/users/"));
    REQUIRE_FALSE(m.matchPath("/users"));
    REQUIRE_FALSE(m.matchPath("/accounts/42"));
    REQUIRE_FALSE(m.matchPath("/prefix/users/42"));
}

TEST_CASE("Several variables split on literal boundaries", "[template]") {
    UriTemplateMatcher m("/users/{uid}/posts/{pid}.json");

    auto r = m.matchPath("/users/7/posts/99.json");
    REQUIRE(r);
    REQUIRE(r->get("uid") == json("7"));
    REQUIRE(r->get("pid") == json("99"));
    REQUIRE(m.variableCount() == 2);
    REQUIRE_FALSE(m.matchPath("/users/7/posts/99.xml"));
}

TEST_CASE("Literal regex metacharacters match literally", "[template]") {
    UriTemplateMatcher m("/v1.0/items+/{id}");

    REQUIRE(m.matchPath("/v1.0/items+/5"));
    REQUIRE_FALSE(m.matchPath("/v1x0/items+/5"));
    REQUIRE_FALSE(m.matchPath("/v1.0/itemsss/5"));
}

TEST_CASE("Captured path values are percent-decoded", "[template]") {
    UriTemplateMatcher m("/files/{name}");
    auto r = m.matchPath("/files/a%20b%2Fc");
    REQUIRE(r);
    REQUIRE(r->get("name") == json("a b/c"));
}

TEST_CASE("Hyphens in variable names become underscores", "[template]") {
    UriTemplateMatcher m("/users/{user-id}");
    REQUIRE(m.names() == std::vector<std::string>{ "user_id" });
    REQUIRE(m.hasName("user_id"));
    REQUIRE_FALSE(m.hasName("user-id"));

    auto r = m.matchPath("/users/x");
    REQUIRE(r);
    REQUIRE(r->get("user_id") == json("x"));
}

TEST_CASE("A capture widens until the rest of the path matches", "[template]") {
    UriTemplateMatcher m("/a/{x}/b");
    auto r = m.matchPath("/a/1/b/2/b");
    REQUIRE(r);
    REQUIRE(r->get("x") == json("1/b/2"));

    UriTemplateMatcher two("/a/{x}/b/{y}");
    auto t = two.matchPath("/a/1/b/2/b/3");
    REQUIRE(t);
    REQUIRE(t->get("x") == json("1"));
    REQUIRE(t->get("y") == json("2/b/3"));
    REQUIRE_FALSE(two.matchPath("/a/1/b/"));
}

TEST_CASE("Adjacent variables take one character first", "[template]") {
    UriTemplateMatcher m("/{a}{b}");
    auto r = m.matchPath("/xyz");
    REQUIRE(r);
    REQUIRE(r->get("a") == json("x"));
    REQUIRE(r->get("b") == json("yz"));
    REQUIRE_FALSE(m.matchPath("/x"));
}

TEST_CASE("A literal template matches only itself", "[template]") {
    UriTemplateMatcher m("/health");
    REQUIRE(m.matchPath("/health"));
    REQUIRE_FALSE(m.matchPath("/health/"));
    REQUIRE_FALSE(m.matchPath("/healt"));
}

TEST_CASE("Matching a 100 KB path or query does not exhaust the stack", "[template]") {
    UriTemplateMatcher m("/users/{id}/posts?q={term}");

    std::string id(100000, 'a');
    auto r = m.matchPath("/users/" + id + "/posts");
    REQUIRE(r);
    REQUIRE(r->get("id") == json(id));
    REQUIRE_FALSE(m.matchPath("/users/" + id + "/post"));

    std::string term(300000, 'q');
    auto q = m.matchQuery("x=1&q=" + term);
    REQUIRE(q);
    REQUIRE(q->get("term") == json(term));
}

// ------------------------------------------------------------------
// 2) Construction errors
// ------------------------------------------------------------------
TEST_CASE("Duplicate variables are rejected", "[template]") {
    REQUIRE_THROWS_AS(UriTemplateMatcher("/a/{x}/b/{x}"), TemplateError);
    REQUIRE_THROWS_AS(UriTemplateMatcher("/a/{x}?k={x}"), TemplateError);
    // normalized names collide as well
    REQUIRE_THROWS_AS(UriTemplateMatcher("/a/{a-b}/{a_b}"), TemplateError);
    REQUIRE_THROWS_WITH(UriTemplateMatcher("/a/{x}/{x}"),
                        Catch::Matchers::ContainsSubstring("every variable must not be duplicated: x"));
}

TEST_CASE("Malformed templates are rejected", "[template]") {
    REQUIRE_THROWS_AS(UriTemplateMatcher("/a/{x"), TemplateError);
    REQUIRE_THROWS_AS(UriTemplateMatcher("/a/x}"), TemplateError);
    REQUIRE_THROWS_AS(UriTemplateMatcher("/a/{x y}"), TemplateError);
    REQUIRE_THROWS_AS(UriTemplateMatcher("/a?k={x}?j={y}"), TemplateError);
    REQUIRE_THROWS_AS(UriTemplateMatcher("/a?k=x"), TemplateError);
}

// ------------------------------------------------------------------
// 3) Query clause
// ------------------------------------------------------------------
TEST_CASE("Query clause requires every declared key", "[template][query]") {
    UriTemplateMatcher m("/search?q={term}&page={page}");

    auto r = m.matchQuery("q=hello&page=2");
    REQUIRE(r);
    REQUIRE(r->get("term") == json("hello"));
    REQUIRE(r->get("page") == json("2"));

    REQUIRE_FALSE(m.matchQuery("q=hello"));
    REQUIRE_FALSE(m.matchQuery(""));
}

TEST_CASE("Repeated query keys capture a list", "[template][query]") {
    UriTemplateMatcher m("/search?q={term}");

    auto r = m.matchQuery("q=a&other=1&q=b");
    REQUIRE(r);
    REQUIRE(r->count("term") == 2);
    REQUIRE(r->get("term") == json::array({ "a", "b" }));
}

TEST_CASE("Query keys are matched whole, not as suffixes", "[template][query]") {
    UriTemplateMatcher m("/search?q={term}");
    REQUIRE_FALSE(m.matchQuery("xq=1"));
    REQUIRE(m.matchQuery("xq=1&q=2")->get("term") == json("2"));
}

TEST_CASE("Empty query values do not satisfy a key", "[template][query]") {
    UriTemplateMatcher m("/search?q={term}");
    REQUIRE_FALSE(m.matchQuery("q="));
    REQUIRE_FALSE(m.matchQuery("q"));
    REQUIRE(m.matchQuery("q=&q=a=b")->get("term") == json("a=b"));
}

TEST_CASE("Query values are decoded with '+' as space", "[template][query]") {
    UriTemplateMatcher m("/search?q={term}");
    REQUIRE(m.matchQuery("q=hello+big%21world")->get("term") == json("hello big!world"));
}

TEST_CASE("A template without a query clause accepts any query", "[template][query]") {
    UriTemplateMatcher m("/users/{id}");
    REQUIRE_FALSE(m.hasQueryClause());
    auto r = m.matchQuery("anything=1&else");
    REQUIRE(r);
    REQUIRE(r->empty());
}

TEST_CASE("Variables are listed path first", "[template]") {
    UriTemplateMatcher m("/orgs/{org}/repos?sort={sort-by}");
    REQUIRE(m.names() == std::vector<std::string>{ "org", "sort_by" });
    REQUIRE(m.hasQueryClause());
    REQUIRE(m.uriTemplate() == "/orgs/{org}/repos?sort={sort-by}");
}
