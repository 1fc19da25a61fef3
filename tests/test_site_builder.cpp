#include "quire_tests.h"

#include "core/errors.hpp"
#include "core/site_builder.hpp"

#include <map>

using namespace std;

namespace {

BuildOptions quiet(unsigned jobs = 0) {
    BuildOptions options;
    options.quiet = true;
    options.concurrency = jobs;
    return options;
}

// Relative path -> contents for every file under `dir`.
map<string, string> snapshot(const TempSite& site, const string& dir) {
    map<string, string> files;
    const auto root = site.path(dir);
    for (const auto& entry : filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            const auto relative = filesystem::relative(entry.path(), site.root()).generic_string();
            files[relative] = site.read(relative);
        }
    }
    return files;
}

void write_blog(const TempSite& site) {
    site.write("config.yaml", "title: Test Blog\nurl: https://blog.example\npaginate: 2\n");
    site.write_basic_templates();
    site.write("content/about.md", "---\ntitle: About\n---\nAbout *me*.\n");
    for (int i = 1; i <= 5; ++i) {
        site.write("content/posts/p" + to_string(i) + ".md",
                   "---\ntitle: Post " + to_string(i) + "\ndate: 2024-01-0" + to_string(i)
                   + "\ntags: [" + (i % 2 ? "odd" : "even") + ", All Posts]\n---\nBody " + to_string(i) + "\n");
    }
}

} // anonymous namespace

const lest::test specification[] = {

STARTCASE(BuildsHelloWorld) {
    TempSite site;
    site.write("config.yaml", "title: Hello Site\n");
    site.write("templates/post.html", "<h1>{{ page.title }}</h1>{{ page.content }}<i>{{ site.title }}</i>");
    site.write("content/posts/hello.md", "---\ntitle: Hello\n---\n# Hi\n");

    auto result = build_site(site.root(), quiet());

    EXPECT(result.success);
    CHECK_EQUAL(result.items_total, 1);
    CHECK_EQUAL(result.items_rendered, 1);
    EXPECT(result.errors.empty());
    CHECK_EQUAL(result.exit_code(), 0);

    const auto html = site.read("_site/posts/hello/index.html");
    CHECK_CONTAINS(html, "<h1>Hello</h1>");
    CHECK_CONTAINS(html, "<h1>Hi</h1>");
    CHECK_CONTAINS(html, "<i>Hello Site</i>");
} ENDCASE

STARTCASE(MissingTemplateFailsOnlyThatItem) {
    TempSite site;
    site.write_basic_templates();
    site.write("content/good.md", "fine");
    site.write("content/bad.md", "---\nlayout: gallery\n---\nbroken");

    auto result = build_site(site.root(), quiet());

    EXPECT(result.success);
    CHECK_EQUAL(result.items_rendered, 1);
    CHECK_EQUAL(result.items_failed, 1);
    CHECK_EQUAL(result.count(ErrorKind::TemplateNotFound), 1);
    CHECK_EQUAL(result.errors.front().path, "bad.md");
    EXPECT(site.exists("_site/good/index.html"));
    EXPECT(!site.exists("_site/bad/index.html"));
} ENDCASE

STARTCASE(DraftsAreExcludedUnlessRequested) {
    TempSite site;
    site.write_basic_templates();
    site.write("content/posts/live.md", "live");
    site.write("content/posts/wip.md", "---\ndraft: true\n---\nwip");

    auto result = build_site(site.root(), quiet());
    EXPECT(result.success);
    CHECK_EQUAL(result.drafts.size(), 1u);
    EXPECT(site.exists("_site/posts/live/index.html"));
    EXPECT(!site.exists("_site/posts/wip/index.html"));

    auto options = quiet();
    options.include_drafts = true;
    auto with_drafts = build_site(site.root(), options);
    EXPECT(site.exists("_site/posts/wip/index.html"));
    CHECK_EQUAL(with_drafts.items_rendered, 2);
} ENDCASE

STARTCASE(MalformedItemIsIsolated) {
    TempSite site;
    site.write_basic_templates();
    site.write("content/a.md", "a");
    site.write("content/b.md", "b");
    site.write("content/c.md", "c");
    site.write("content/broken.md", "---\ntitle: [never closed\n---\nx");

    auto result = build_site(site.root(), quiet(4));

    EXPECT(result.success);
    CHECK_EQUAL(result.items_total, 4);
    CHECK_EQUAL(result.items_rendered, 3);
    CHECK_EQUAL(result.count(ErrorKind::Load), 1);
    EXPECT(site.exists("_site/a/index.html"));
    EXPECT(site.exists("_site/b/index.html"));
    EXPECT(site.exists("_site/c/index.html"));
} ENDCASE

STARTCASE(KindDefaultTemplates) {
    TempSite site;
    site.write_basic_templates();
    site.write("content/posts/x.md", "post body");
    site.write("content/about.md", "page body");

    build_site(site.root(), quiet());

    CHECK_CONTAINS(site.read("_site/posts/x/index.html"), "<article>");
    CHECK_CONTAINS(site.read("_site/about/index.html"), "<html>");
} ENDCASE

STARTCASE(RebuildIsIdempotent) {
    TempSite site;
    write_blog(site);
    site.write("templates/default.html",
               "<link href=\"/static/style.css?v={{ site.build }}\">{{ page.content }}");

    auto first = build_site(site.root(), quiet(1));
    const auto before = snapshot(site, "_site");
    auto second = build_site(site.root(), quiet(8));
    const auto after = snapshot(site, "_site");

    EXPECT(first.success);
    EXPECT(second.success);
    EXPECT(before == after);
    CHECK_CONTAINS(after.at("_site/about/index.html"), "style.css?v=");
} ENDCASE

STARTCASE(BuildIdFollowsSources) {
    TempSite site;
    write_blog(site);
    site.write("templates/default.html", "{{ site.build }}");

    EXPECT(build_site(site.root(), quiet()).success);
    const auto first = site.read("_site/about/index.html");
    CHECK_EQUAL(first.size(), 16u);

    site.write("content/about.md", "---\ntitle: About\n---\nChanged.\n");
    EXPECT(build_site(site.root(), quiet()).success);
    EXPECT(site.read("_site/about/index.html") != first);
} ENDCASE

STARTCASE(ConfigErrorWritesNothing) {
    TempSite site;
    site.write_basic_templates();
    site.write("config.yaml", "title: [unterminated\n");
    site.write("content/a.md", "a");

    auto result = build_site(site.root(), quiet());

    EXPECT(!result.success);
    CHECK_EQUAL(result.exit_code(), 1);
    CHECK_EQUAL(result.count(ErrorKind::Config), 1);
    EXPECT(!site.exists("_site"));
} ENDCASE

STARTCASE(OutputDirMustBeInsideRoot) {
    TempSite site;
    site.write_basic_templates();
    site.write("content/a.md", "a");

    site.write("config.yaml", "output_dir: .\n");
    auto result = build_site(site.root(), quiet());
    EXPECT(!result.success);
    CHECK_EQUAL(result.count(ErrorKind::Config), 1);
    EXPECT(site.exists("content/a.md"));

    site.write("config.yaml", "output_dir: ../elsewhere\n");
    EXPECT(!build_site(site.root(), quiet()).success);
} ENDCASE

STARTCASE(OutputDirMustNotOverlapSources) {
    TempSite site;
    site.write_basic_templates();
    site.write("content/a.md", "a");
    site.write("static/style.css", "body {}");

    for (const string dir : {"content", "templates", "static", "content/../content",
                             "content/out", "static/generated"}) {
        site.write("config.yaml", "output_dir: " + dir + "\n");
        auto result = build_site(site.root(), quiet());
        EXPECT(!result.success);
        CHECK_EQUAL(result.count(ErrorKind::Config), 1);
    }

    // The output directory would contain the content directory.
    site.write("config.yaml", "output_dir: site\ncontent_dir: site/content\n");
    site.write("site/content/b.md", "b");
    EXPECT(!build_site(site.root(), quiet()).success);

    EXPECT(site.exists("content/a.md"));
    EXPECT(site.exists("templates/default.html"));
    EXPECT(site.exists("static/style.css"));
    EXPECT(site.exists("site/content/b.md"));

    SiteConfig config;
    config.output_dir = "public";
    CHECK_EQUAL(SiteBuilder::guarded_output_dir(site.root(), config).filename().string(), "public");
} ENDCASE

STARTCASE(HomePaginationAndTags) {
    TempSite site;
    write_blog(site);
    site.write("templates/index.html",
               "{{ paginator.page }}/{{ paginator.total_pages }}:"
               "{% for p in paginator.posts %}[{{ p.title }}]{% endfor %}"
               "{% if paginator.next_url %} next={{ paginator.next_url }}{% endif %}");
    site.write("templates/tag.html",
               "{{ page.tag }}:{% for p in paginator.posts %}[{{ p.title }}]{% endfor %}");

    auto result = build_site(site.root(), quiet());

    EXPECT(result.success);
    CHECK_EQUAL(result.items_rendered, 6);
    CHECK_EQUAL(site.read("_site/index.html"), "1/3:[Post 5][Post 4] next=/page/2/");
    CHECK_EQUAL(site.read("_site/page/2/index.html"), "2/3:[Post 3][Post 2] next=/page/3/");
    CHECK_EQUAL(site.read("_site/page/3/index.html"), "3/3:[Post 1]");
    CHECK_EQUAL(site.read("_site/tags/odd/index.html"), "odd:[Post 5][Post 3][Post 1]");
    EXPECT(site.exists("_site/tags/all-posts/index.html"));
    CHECK_EQUAL(result.listing_pages, 3 + 3);
} ENDCASE

STARTCASE(ContentIndexWinsOverHomeListing) {
    TempSite site;
    site.write_basic_templates();
    site.write("templates/index.html", "listing");
    site.write("content/index.md", "---\ntitle: Home\n---\nmine");

    auto result = build_site(site.root(), quiet());
    EXPECT(result.success);
    CHECK_CONTAINS(site.read("_site/index.html"), "<title>Home</title>");
    CHECK_EQUAL(result.listing_pages, 0);
} ENDCASE

STARTCASE(PostsListedNewestFirst) {
    TempSite site;
    write_blog(site);
    site.write("templates/default.html",
               "{% for p in content %}{{ p.title }};{% endfor %}");

    build_site(site.root(), quiet());
    CHECK_EQUAL(site.read("_site/about/index.html"), "Post 5;Post 4;Post 3;Post 2;Post 1;");
} ENDCASE

STARTCASE(StaticFilesAreCopied) {
    TempSite site;
    site.write_basic_templates();
    site.write("content/a.md", "a");
    site.write("static/css/site.css", "body{}");
    site.write("static/img/logo.svg", "<svg/>");

    auto result = build_site(site.root(), quiet());
    CHECK_EQUAL(result.static_files, 2);
    CHECK_EQUAL(site.read("_site/static/css/site.css"), "body{}");
    EXPECT(site.exists("_site/static/img/logo.svg"));
} ENDCASE

STARTCASE(StaleOutputIsRemoved) {
    TempSite site;
    site.write_basic_templates();
    site.write("content/a.md", "a");
    site.write("content/b.md", "b");
    build_site(site.root(), quiet());
    EXPECT(site.exists("_site/b/index.html"));

    filesystem::remove(site.path("content/b.md"));
    build_site(site.root(), quiet());
    EXPECT(!site.exists("_site/b/index.html"));
    EXPECT(site.exists("_site/a/index.html"));
} ENDCASE

STARTCASE(DuplicateOutputPathIsReported) {
    TempSite site;
    site.write_basic_templates();
    site.write("content/about.md", "first");
    site.write("content/zz.md", "---\npermalink: /about/\n---\nsecond");

    auto result = build_site(site.root(), quiet());
    EXPECT(result.success);
    CHECK_EQUAL(result.items_rendered, 1);
    CHECK_EQUAL(result.errors.size(), 1u);
    CHECK_EQUAL(result.errors.front().path, "zz.md");
    CHECK_CONTAINS(site.read("_site/about/index.html"), "first");
} ENDCASE

STARTCASE(StructuredOutputFormats) {
    TempSite site;
    site.write("config.yaml", "output_formats: [html, plain, xml, json]\n");
    site.write_basic_templates();
    site.write("content/posts/x.md",
               "---\ntitle: X & Y\ntags: [a, b]\n---\n"
               "Intro text.\n\n"
               "## Getting Started!\n\n"
               "Some *emphasis* here.\n\n"
               "- one\n- two\n\n"
               "```cpp\nint x = 1 < 2;\n```\n\n"
               "> quoted\n");

    auto result = build_site(site.root(), quiet());
    EXPECT(result.success);
    EXPECT(result.errors.empty());

    const auto plain = site.read("_site/posts/x/index.txt");
    CHECK_CONTAINS(plain, "METADATA:\nLayout: post\nTags: a, b\nTitle: X & Y\n");
    CHECK_CONTAINS(plain, "\nCONTENT:\n" + string(80, '=') + "\n\nIntro text.\n");
    CHECK_CONTAINS(plain, "Getting Started!\n\nSome emphasis here.\n\n- one\n- two\n");
    CHECK_CONTAINS(plain, "    int x = 1 < 2;\n");

    const auto xml = site.read("_site/posts/x/index.xml");
    CHECK_CONTAINS(xml, "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<document>\n  <meta>\n");
    CHECK_CONTAINS(xml, "    <title>X &amp; Y</title>\n");
    CHECK_CONTAINS(xml, "    <paragraph>Intro text.</paragraph>\n");
    CHECK_CONTAINS(xml, "<section id=\"getting-started\" level=\"2\">");
    CHECK_CONTAINS(xml, "<list type=\"bullet\">");
    CHECK_CONTAINS(xml, "<code language=\"cpp\">int x = 1 &lt; 2;\n</code>");
    CHECK_CONTAINS(xml, "<quote>quoted</quote>");
    CHECK_CONTAINS(xml, "</section>\n  </content>\n</document>\n");

    auto doc = nlohmann::json::parse(site.read("_site/posts/x/index.json"));
    CHECK_EQUAL(doc["metadata"]["title"].get<string>(), "X & Y");
    CHECK_EQUAL(doc["metadata"]["layout"].get<string>(), "post");
    CHECK_EQUAL(doc["content"]["preamble"][0]["text"].get<string>(), "Intro text.");
    const auto& section = doc["content"]["sections"][0];
    CHECK_EQUAL(section["id"].get<string>(), "getting-started");
    CHECK_EQUAL(section["level"].get<int>(), 2);
    CHECK_EQUAL(section["content"][0]["text"].get<string>(), "Some emphasis here.");
    CHECK_EQUAL(section["content"][1]["style"].get<string>(), "bullet");
    CHECK_EQUAL(section["content"][1]["items"][1].get<string>(), "two");
    CHECK_EQUAL(section["content"][2]["language"].get<string>(), "cpp");
    CHECK_EQUAL(section["content"][3]["type"].get<string>(), "quote");
} ENDCASE

STARTCASE(HomePageListsPages) {
    TempSite site;
    write_blog(site);
    site.write("content/contact.md", "---\ntitle: Contact\n---\nMail me.\n");
    site.write("templates/index.html",
               "{% for p in page.pages %}[{{ p.title }}]{% endfor %}"
               "{% for p in page.posts %}({{ p.title }}){% endfor %}");

    auto result = build_site(site.root(), quiet());

    EXPECT(result.success);
    CHECK_EQUAL(site.read("_site/index.html"), "[About][Contact](Post 5)(Post 4)");
} ENDCASE

STARTCASE(ListingsCarryResolvedLayout) {
    TempSite site;
    write_blog(site);
    site.write("templates/index.html",
               "{% for p in content %}{{ p.layout }};{% endfor %}|{{ page.pages.0.layout }}");

    auto result = build_site(site.root(), quiet());

    EXPECT(result.success);
    CHECK_EQUAL(site.read("_site/index.html"), "post;post;post;post;post;|default");
} ENDCASE

STARTCASE(WriteErrorStopsTheBuild) {
    TempSite site;
    site.write_basic_templates();
    site.write("content/a.md", "---\npermalink: /x.html\n---\nfirst");
    // Needs x.html to be a directory.
    site.write("content/b.md", "---\npermalink: /x.html/y.html\n---\nsecond");
    site.write("content/c.md", "third");

    auto result = build_site(site.root(), quiet());

    EXPECT(!result.success);
    CHECK_EQUAL(result.exit_code(), 1);
    CHECK_EQUAL(result.count(ErrorKind::Write), 1);
    EXPECT(result.has_fatal_error());
    EXPECT(site.exists("_site/x.html"));
    EXPECT(!site.exists("_site/c/index.html"));
} ENDCASE

STARTCASE(UnsupportedFormatIsConversionError) {
    TempSite site;
    site.write_basic_templates();
    site.write("content/x.md", "body");

    auto options = quiet();
    options.formats = {"html", "latex"};
    auto result = build_site(site.root(), options);
    EXPECT(result.success);
    CHECK_EQUAL(result.count(ErrorKind::Conversion), 1);
    EXPECT(site.exists("_site/x/index.html"));
} ENDCASE

STARTCASE(NothingRenderedIsFailure) {
    TempSite site;
    site.write("content/a.md", "a");

    auto result = build_site(site.root(), quiet());
    EXPECT(!result.success);
    CHECK_EQUAL(result.items_rendered, 0);
    CHECK_EQUAL(result.count(ErrorKind::TemplateNotFound), 1);
} ENDCASE

STARTCASE(EmptySiteSucceeds) {
    TempSite site;
    auto result = build_site(site.root(), quiet());
    EXPECT(result.success);
    CHECK_EQUAL(result.items_total, 0);
    EXPECT(site.exists("_site"));
} ENDCASE

STARTCASE(RenderErrorNamesTemplate) {
    TempSite site;
    site.write("templates/default.html", "{{ page.missing.value }}");
    site.write("content/a.md", "a");
    site.write("content/b.md", "---\nlayout: ok\n---\nb");
    site.write("templates/ok.html", "fine");

    auto result = build_site(site.root(), quiet());
    EXPECT(result.success);
    CHECK_EQUAL(result.count(ErrorKind::Render), 1);
    CHECK_EQUAL(result.errors.front().path, "a.md");
    CHECK_CONTAINS(result.errors.front().message, "default");
} ENDCASE

STARTCASE(PaginateHelper) {
    CHECK_EQUAL(SiteBuilder::paginate(0, 10).size(), 1u);
    CHECK_EQUAL(SiteBuilder::paginate(5, 2).size(), 3u);
    CHECK_EQUAL(SiteBuilder::paginate(5, 2).back().size(), 1u);
    CHECK_EQUAL(SiteBuilder::paginate(5, 0).size(), 1u);
} ENDCASE

}; //lest

int main( int argc, char * argv[] )
{
    set_test_log_level();
    return lest::run( specification, argc, argv );
}
