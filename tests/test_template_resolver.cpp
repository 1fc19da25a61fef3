#include "quire_tests.h"

#include "core/content_item.hpp"
#include "core/errors.hpp"
#include "core/template_resolver.hpp"

using namespace std;

namespace {

ContentItem make_item(const string& source, const string& header = "") {
    auto [fm, body] = FrontMatter::parse(header.empty() ? "body" : "---\n" + header + "---\nbody");
    return ContentItem::create(source, fm, body);
}

} // anonymous namespace

const lest::test specification[] = {

STARTCASE(ListsTemplatesRecursively) {
    TempSite site;
    site.write("templates/default.html", "d");
    site.write("templates/layouts/wide.html", "w");
    site.write("templates/partials/nav.htm", "not a template id");

    TemplateResolver resolver(site.path("templates"));
    EXPECT(resolver.has("default"));
    EXPECT(resolver.has("layouts/wide"));
    EXPECT(resolver.has("layouts/wide.html"));
    EXPECT(!resolver.has("partials/nav"));
    CHECK_EQUAL(resolver.templates().size(), 2u);
} ENDCASE

STARTCASE(ExplicitLayoutWins) {
    TempSite site;
    site.write_basic_templates();
    site.write("templates/special.html", "s");

    TemplateResolver resolver(site.path("templates"));
    CHECK_EQUAL(resolver.resolve(make_item("posts/a.md", "layout: special\n")), "special");
    CHECK_EQUAL(resolver.resolve(make_item("posts/a.md", "layout: special.html\n")), "special");
} ENDCASE

STARTCASE(MissingExplicitLayoutNeverFallsBack) {
    TempSite site;
    site.write_basic_templates();

    TemplateResolver resolver(site.path("templates"));
    try {
        resolver.resolve(make_item("posts/a.md", "layout: missing\n"));
        EXPECT(false);
    } catch (const TemplateNotFoundError& e) {
        CHECK_EQUAL(e.requested_name(), "missing");
        CHECK_EQUAL(e.item_path(), "posts/a.md");
    }
} ENDCASE

STARTCASE(KindDefaults) {
    TempSite site;
    site.write_basic_templates();

    TemplateResolver resolver(site.path("templates"));
    CHECK_EQUAL(resolver.resolve(make_item("posts/a.md")), "post");
    CHECK_EQUAL(resolver.resolve(make_item("about.md")), "default");
} ENDCASE

STARTCASE(PostFallsBackToSiteDefault) {
    TempSite site;
    site.write("templates/base.html", "b");

    TemplateResolver resolver(site.path("templates"), "base");
    CHECK_EQUAL(resolver.resolve(make_item("posts/a.md")), "base");
    CHECK_EQUAL(resolver.resolve(make_item("about.md")), "base");
} ENDCASE

STARTCASE(NothingFoundNamesKindDefault) {
    TempSite site;
    site.write("templates/other.html", "o");

    TemplateResolver resolver(site.path("templates"));
    try {
        resolver.resolve(make_item("posts/a.md"));
        EXPECT(false);
    } catch (const TemplateNotFoundError& e) {
        CHECK_EQUAL(e.requested_name(), "post");
    }
} ENDCASE

STARTCASE(MissingTemplatesDirectory) {
    TempSite site;
    TemplateResolver resolver(site.path("templates"));
    EXPECT(resolver.templates().empty());
    EXPECT_THROWS_AS(resolver.resolve(make_item("about.md")), TemplateNotFoundError);
} ENDCASE

}; //lest

int main( int argc, char * argv[] )
{
    set_test_log_level();
    return lest::run( specification, argc, argv );
}
