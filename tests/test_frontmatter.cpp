#include "quire_tests.h"

#include "core/content_item.hpp"
#include "core/errors.hpp"
#include "core/frontmatter.hpp"

using namespace std;

const lest::test specification[] = {

STARTCASE(ParseHeaderAndBody) {
    auto [fm, body] = FrontMatter::parse(
        "---\n"
        "title: Hello\n"
        "count: 3\n"
        "ratio: 0.5\n"
        "draft: false\n"
        "quoted: \"42\"\n"
        "tags: [a, b]\n"
        "---\n"
        "# Body\n");

    CHECK_EQUAL(fm.get("title"), "Hello");
    EXPECT(fm.data["count"].is_number_integer());
    EXPECT(fm.data["ratio"].is_number_float());
    EXPECT(fm.data["draft"].is_boolean());
    EXPECT(fm.data["quoted"].is_string());
    CHECK_EQUAL(fm.get_list("tags").size(), 2u);
    CHECK_EQUAL(body, "# Body\n");
} ENDCASE

STARTCASE(NoHeaderKeepsWholeBody) {
    auto [fm, body] = FrontMatter::parse("Just text\n---\nmore\n");
    EXPECT(fm.data.empty());
    CHECK_EQUAL(body, "Just text\n---\nmore\n");
} ENDCASE

STARTCASE(BomAndCrlfAreAccepted) {
    auto [fm, body] = FrontMatter::parse("\xEF\xBB\xBF---\r\ntitle: Win\r\n---\r\nBody");
    CHECK_EQUAL(fm.get("title"), "Win");
    CHECK_EQUAL(body, "Body");
} ENDCASE

STARTCASE(EmptyHeaderIsEmptyMapping) {
    auto [fm, body] = FrontMatter::parse("---\n---\nBody\n");
    EXPECT(fm.data.is_object());
    EXPECT(fm.data.empty());
    CHECK_EQUAL(body, "Body\n");
} ENDCASE

STARTCASE(UnterminatedHeaderThrows) {
    EXPECT_THROWS_AS(FrontMatter::parse("---\ntitle: x\nno end\n"), LoadError);
} ENDCASE

STARTCASE(MalformedYamlThrows) {
    EXPECT_THROWS_AS(FrontMatter::parse("---\ntitle: [unclosed\n---\nx"), LoadError);
} ENDCASE

STARTCASE(NonMappingHeaderThrows) {
    EXPECT_THROWS_AS(FrontMatter::parse("---\n- a\n- b\n---\nx"), LoadError);
} ENDCASE

STARTCASE(DerivePrettyOutputPaths) {
    FrontMatter none;
    CHECK_EQUAL(ContentItem::derive_output_path("posts/x.md", none).generic_string(),
                "posts/x/index.html");
    CHECK_EQUAL(ContentItem::derive_output_path("about.md", none).generic_string(),
                "about/index.html");
    CHECK_EQUAL(ContentItem::derive_output_path("index.md", none).generic_string(),
                "index.html");
    CHECK_EQUAL(ContentItem::derive_output_path("docs/index.md", none).generic_string(),
                "docs/index.html");
} ENDCASE

STARTCASE(PermalinkOverridesOutputPath) {
    FrontMatter fm;
    fm.data["permalink"] = "/a/b/";
    CHECK_EQUAL(ContentItem::derive_output_path("x.md", fm).generic_string(),
                "a/b/index.html");

    fm.data["permalink"] = "/feed/atom.html";
    CHECK_EQUAL(ContentItem::derive_output_path("x.md", fm).generic_string(),
                "feed/atom.html");

    fm.data["permalink"] = "../../etc/";
    EXPECT_THROWS_AS(ContentItem::derive_output_path("x.md", fm), LoadError);
} ENDCASE

STARTCASE(DeriveUrls) {
    CHECK_EQUAL(ContentItem::derive_url("posts/x/index.html"), "/posts/x/");
    CHECK_EQUAL(ContentItem::derive_url("a/b.html"), "/a/b.html");
    CHECK_EQUAL(ContentItem::derive_url("index.html"), "/");
} ENDCASE

STARTCASE(DeriveKind) {
    FrontMatter none;
    CHECK_EQUAL_ENUM(ContentItem::derive_kind("posts/x.md", none), ContentKind::Post);
    CHECK_EQUAL_ENUM(ContentItem::derive_kind("about.md", none), ContentKind::Page);
    CHECK_EQUAL_ENUM(ContentItem::derive_kind("posts.md", none), ContentKind::Page);

    FrontMatter page;
    page.data["kind"] = "page";
    CHECK_EQUAL_ENUM(ContentItem::derive_kind("posts/x.md", page), ContentKind::Page);
} ENDCASE

STARTCASE(ItemAccessorsAndPageObject) {
    auto [fm, body] = FrontMatter::parse(
        "---\ndate: 2024-01-02\nauthor_note: hi\n---\nBody\n");
    auto item = ContentItem::create("posts/hello-world.md", fm, body);
    item.rendered_html = "<p>Body</p>";

    CHECK_EQUAL(item.title(), "hello-world");
    CHECK_EQUAL(item.date(), "2024-01-02");
    EXPECT(!item.is_draft());
    CHECK_EQUAL(item.url, "/posts/hello-world/");

    auto page = item.to_json("https://example.org");
    CHECK_EQUAL(page["title"].get<string>(), "hello-world");
    CHECK_EQUAL(page["absolute_url"].get<string>(), "https://example.org/posts/hello-world/");
    CHECK_EQUAL(page["content"].get<string>(), "<p>Body</p>");
    CHECK_EQUAL(page["kind"].get<string>(), "post");
    CHECK_EQUAL(page["author_note"].get<string>(), "hi");
    EXPECT(page["tags"].is_array());
} ENDCASE

STARTCASE(EmptySourcePathIsRejected) {
    EXPECT_THROWS_AS(ContentItem::create("", FrontMatter{}, ""), LoadError);
} ENDCASE

}; //lest

int main( int argc, char * argv[] )
{
    set_test_log_level();
    return lest::run( specification, argc, argv );
}
