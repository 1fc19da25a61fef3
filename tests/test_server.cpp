#include "quire_tests.h"

#include "server/server.hpp"

#include <chrono>
#include <future>

using namespace std;

namespace {

Response fetch(const Server& server, const string& path, const string& method = "GET") {
    Request req;
    req.method = method;
    req.path = path;
    req.version = "HTTP/1.1";
    return server.handle(req);
}

} // anonymous namespace

const lest::test specification[] = {

STARTCASE(ServesIndexForDirectories) {
    TempSite site;
    site.write("_site/index.html", "home");
    site.write("_site/posts/x/index.html", "post x");

    Server server(site.path("_site"));
    auto root = fetch(server, "/");
    CHECK_EQUAL(root.status, 200);
    CHECK_EQUAL(root.body, "home");
    CHECK_CONTAINS(root.headers["Content-Type"], "text/html");

    CHECK_EQUAL(fetch(server, "/posts/x/").body, "post x");
    CHECK_EQUAL(fetch(server, "/posts/x/?utm=1").body, "post x");
} ENDCASE

STARTCASE(RedirectsDirectoryWithoutSlash) {
    TempSite site;
    site.write("_site/posts/x/index.html", "post x");

    Server server(site.path("_site"));
    auto res = fetch(server, "/posts/x");
    CHECK_EQUAL(res.status, 301);
    CHECK_EQUAL(res.headers["Location"], "/posts/x/");
} ENDCASE

STARTCASE(ServesStaticFilesWithMimeTypes) {
    TempSite site;
    site.write("_site/static/site.css", "body{}");
    site.write("_site/my file.txt", "spaced");

    Server server(site.path("_site"));
    auto css = fetch(server, "/static/site.css");
    CHECK_EQUAL(css.status, 200);
    CHECK_EQUAL(css.headers["Content-Type"], "text/css");
    CHECK_EQUAL(fetch(server, "/my%20file.txt").body, "spaced");
} ENDCASE

STARTCASE(RejectsTraversal) {
    TempSite site;
    site.write("_site/index.html", "home");
    site.write("secret.txt", "nope");

    Server server(site.path("_site"));
    CHECK_EQUAL(fetch(server, "/../secret.txt").status, 403);
    CHECK_EQUAL(fetch(server, "/%2e%2e/secret.txt").status, 403);
    CHECK_EQUAL(fetch(server, "//etc/passwd").status, 403);
} ENDCASE

STARTCASE(NotFoundUsesCustomPage) {
    TempSite site;
    site.write("_site/index.html", "home");

    Server server(site.path("_site"));
    auto plain = fetch(server, "/missing/");
    CHECK_EQUAL(plain.status, 404);
    CHECK_CONTAINS(plain.body, "404");

    site.write("_site/404.html", "custom not found");
    auto custom = fetch(server, "/missing/");
    CHECK_EQUAL(custom.status, 404);
    CHECK_EQUAL(custom.body, "custom not found");
} ENDCASE

STARTCASE(OnlyGetAndHead) {
    TempSite site;
    site.write("_site/index.html", "home");

    Server server(site.path("_site"));
    CHECK_EQUAL(fetch(server, "/", "POST").status, 405);

    auto head = fetch(server, "/", "HEAD");
    CHECK_EQUAL(head.status, 200);
    const auto wire = head.to_http(false);
    CHECK_CONTAINS(wire, "Content-Length: 4");
    EXPECT(wire.find("home") == string::npos);
} ENDCASE

STARTCASE(ResolvesHostNames) {
    in_addr addr{};
    EXPECT(Server::resolve_host("127.0.0.1", addr));
    CHECK_EQUAL(string(inet_ntoa(addr)), "127.0.0.1");

    in_addr local{};
    EXPECT(Server::resolve_host("localhost", local));
    CHECK_EQUAL(string(inet_ntoa(local)), "127.0.0.1");
} ENDCASE

STARTCASE(StopBeforeListenReturns) {
    TempSite site;
    site.write("_site/index.html", "home");

    Server server(site.path("_site"));
    server.stop();

    auto listening = async(launch::async, [&server] {
        return server.listen("127.0.0.1", 0);
    });
    EXPECT(listening.wait_for(chrono::seconds(5)) == future_status::ready);
    EXPECT(listening.get());
    EXPECT(!server.is_running());
} ENDCASE

}; //lest

int main( int argc, char * argv[] )
{
    set_test_log_level();
    return lest::run( specification, argc, argv );
}
