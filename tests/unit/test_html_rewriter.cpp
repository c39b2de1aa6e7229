#include "mountproxy/relay/HtmlRewriter.h"
#include "mountproxy/protocol/HtmlEscape.h"
#include "mountproxy/common/Logger.h"

#include <cassert>
#include <string>

using namespace mountproxy::relay;
using namespace mountproxy::common;

static const std::string kMount = "/marimo/semantic-entropy-probe-comparison";

static const char kSampleHtml[] =
    "<!doctype html>\n"
    "<html lang=\"en\">\n"
    "  <head>\n"
    "    <meta charset=\"utf-8\" />\n"
    "  </head>\n"
    "  <body>\n"
    "    <marimo-user-config data-config=\"{&quot;display&quot;:{&quot;theme&quot;:&quot;light&quot;}}\"></marimo-user-config>\n"
    "    <script data-marimo=\"true\">\n"
    "      window.__MARIMO_MOUNT_CONFIG__ = {\n"
    "        \"config\": {\"display\": {\"theme\": \"light\"}},\n"
    "      };\n"
    "    </script>\n"
    "    <a href=\"/assets/app.js\">asset</a>\n"
    "    <img src=\"/marimo/semantic-entropy-probe-comparison/assets/already.png\" />\n"
    "  </body>\n"
    "</html>\n";

static bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

static size_t countOf(const std::string& s, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = s.find(needle); pos != std::string::npos; pos = s.find(needle, pos + 1)) ++n;
    return n;
}

void testDarkThemeOverride() {
    const std::string out = RewriteHtml(kSampleHtml, kMount, std::string("dark"));
    assert(contains(out, "<base href=\"/marimo/semantic-entropy-probe-comparison/\" />"));
    assert(contains(out, "href=\"/marimo/semantic-entropy-probe-comparison/assets/app.js\""));
    assert(contains(out, "src=\"/marimo/semantic-entropy-probe-comparison/assets/already.png\""));
    assert(contains(out, "\"theme\": \"dark\""));
    assert(contains(out, "&quot;theme&quot;:&quot;dark&quot;"));
    assert(!contains(out, "light"));
    LOG_INFO << "Dark theme override PASS";
}

void testNoThemeLeavesConfigAlone() {
    const std::string out = RewriteHtml(kSampleHtml, kMount);
    assert(contains(out, "\"theme\": \"light\""));
    assert(contains(out, "&quot;theme&quot;:&quot;light&quot;"));

    // Unsupported values behave like no theme at all.
    const std::string odd = RewriteHtml(kSampleHtml, kMount, std::string("solarized"));
    assert(odd == out);
    LOG_INFO << "No theme PASS";
}

void testBaseInjection() {
    const std::string once = InjectBaseTag("<html><HEAD lang=\"x\"><title>t</title></HEAD></html>", kMount + "/");
    assert(once == "<html><HEAD lang=\"x\">\n<base href=\"" + kMount + "/\" /><title>t</title></HEAD></html>");
    // Never a second base.
    assert(InjectBaseTag(once, kMount) == once);
    // An existing base of any spelling suppresses injection.
    const std::string own = "<head><BASE href=\"/x/\"></head>";
    assert(InjectBaseTag(own, kMount) == own);
    // <header> is not <head>.
    const std::string header = "<body><header>x</header></body>";
    assert(InjectBaseTag(header, kMount) == header);
    // No head at all.
    assert(InjectBaseTag("<p>fragment</p>", kMount) == "<p>fragment</p>");

    const std::string doc = RewriteHtml("<html><head></head><body></body></html>", kMount);
    assert(countOf(doc, "<base ") == 1);
    assert(RewriteHtml(doc, kMount) == doc);
    LOG_INFO << "Base injection PASS";
}

void testRootRelativeAttributes() {
    const std::string prefix = kMount + "/";
    assert(RewriteRootRelativeAttributes("<a href=\"/x\">", kMount) == "<a href=\"" + prefix + "x\">");
    assert(RewriteRootRelativeAttributes("<img src='/i.png'>", kMount) == "<img src='" + prefix + "i.png'>");
    assert(RewriteRootRelativeAttributes("<form action=\"/go\">", kMount) == "<form action=\"" + prefix + "go\">");
    // Root itself.
    assert(RewriteRootRelativeAttributes("<a href=\"/\">", kMount) == "<a href=\"" + prefix + "\">");
    // Protocol-relative, relative and absolute URLs are untouched.
    assert(RewriteRootRelativeAttributes("<a href=\"//cdn/x\">", kMount) == "<a href=\"//cdn/x\">");
    assert(RewriteRootRelativeAttributes("<a href=\"x/y\">", kMount) == "<a href=\"x/y\">");
    assert(RewriteRootRelativeAttributes("<a href=\"https://h/x\">", kMount) == "<a href=\"https://h/x\">");
    // Attribute names are matched on a word boundary and case-sensitively.
    assert(RewriteRootRelativeAttributes("<a xhref=\"/x\">", kMount) == "<a xhref=\"/x\">");
    assert(RewriteRootRelativeAttributes("<a HREF=\"/x\">", kMount) == "<a HREF=\"/x\">");
    assert(RewriteRootRelativeAttributes("<img data-src=\"/x\">", kMount) == "<img data-src=\"" + prefix + "x\">");
    // Word boundaries are decided on whole code points: a no-break space
    // separates, a preceding letter does not.
    assert(RewriteRootRelativeAttributes("<a\xC2\xA0href=\"/x\">", kMount) ==
           "<a\xC2\xA0href=\"" + prefix + "x\">");
    assert(RewriteRootRelativeAttributes("<a\xE2\x80\x83src=\"/x\">", kMount) ==
           "<a\xE2\x80\x83src=\"" + prefix + "x\">");
    assert(RewriteRootRelativeAttributes("<a caf\xC3\xA9href=\"/x\">", kMount) == "<a caf\xC3\xA9href=\"/x\">");
    // Spaces around '=' do not match.
    assert(RewriteRootRelativeAttributes("<a href = \"/x\">", kMount) == "<a href = \"/x\">");
    // Already mounted paths, and the mount itself, stay as they are.
    assert(RewriteRootRelativeAttributes("<a href=\"" + kMount + "\">", kMount) == "<a href=\"" + kMount + "\">");
    assert(RewriteRootRelativeAttributes("<a href=\"" + prefix + "a\">", kMount) == "<a href=\"" + prefix + "a\">");
    // A sibling path sharing the prefix text is not mounted.
    assert(RewriteRootRelativeAttributes("<a href=\"" + kMount + "-x\">", kMount) ==
           "<a href=\"" + prefix + kMount.substr(1) + "-x\">");

    const std::string once = RewriteRootRelativeAttributes("<a href=\"/p\"><img src=\"/q\">", kMount);
    assert(RewriteRootRelativeAttributes(once, kMount) == once);
    LOG_INFO << "Root-relative attributes PASS";
}

void testMountConfigTheme() {
    const std::string html = "<script>window.__MARIMO_MOUNT_CONFIG__ = {\"a\":{\"theme\" : \"system\"}};</script>"
                             "<script>window.__MARIMO_MOUNT_CONFIG__ = {\"theme\": \"light\"};</script>";
    const std::string out = RewriteMountConfigTheme(html, "dark");
    assert(contains(out, "{\"a\":{\"theme\" : \"dark\"}};"));
    // Only the first block is touched.
    assert(contains(out, "{\"theme\": \"light\"};"));

    // Assignment spelled in another case is still recognised.
    const std::string lower = "window.__marimo_mount_config__={\"theme\":\"light\"} ;";
    assert(RewriteMountConfigTheme(lower, "dark") == "window.__marimo_mount_config__={\"theme\":\"dark\"} ;");

    // No theme key, no block, or an empty value: unchanged.
    const std::string noKey = "window.__MARIMO_MOUNT_CONFIG__ = {\"x\": 1};";
    assert(RewriteMountConfigTheme(noKey, "dark") == noKey);
    const std::string noBlock = "<p>\"theme\": \"light\"</p>";
    assert(RewriteMountConfigTheme(noBlock, "dark") == noBlock);
    const std::string emptyValue = "window.__MARIMO_MOUNT_CONFIG__ = {\"theme\": \"\"};";
    assert(RewriteMountConfigTheme(emptyValue, "dark") == emptyValue);
    // A theme key after the terminating "};" belongs to something else.
    const std::string after = "window.__MARIMO_MOUNT_CONFIG__ = {\"x\": 1};\nvar o = {\"theme\": \"light\"};";
    assert(RewriteMountConfigTheme(after, "dark") == after);
    LOG_INFO << "Mount config theme PASS";
}

void testUserConfigTheme() {
    using mountproxy::protocol::HtmlEscape;

    // display missing: it is created.
    const std::string noDisplay = "<marimo-user-config data-config=\"" + HtmlEscape("{\"a\":1}") + "\"></marimo-user-config>";
    const std::string out = RewriteUserConfigTheme(noDisplay, "dark");
    assert(contains(out, "&quot;display&quot;:{&quot;theme&quot;:&quot;dark&quot;}"));
    assert(contains(out, "&quot;a&quot;:1"));

    // display of the wrong type is replaced.
    const std::string badDisplay = "<marimo-user-config data-config=\"" + HtmlEscape("{\"display\":[1]}") + "\">";
    assert(contains(RewriteUserConfigTheme(badDisplay, "light"), "&quot;display&quot;:{&quot;theme&quot;:&quot;light&quot;}"));

    // Other display settings survive.
    const std::string keep = "<marimo-user-config data-config=\"" +
                             HtmlEscape("{\"display\":{\"theme\":\"light\",\"width\":\"full\"}}") + "\">";
    const std::string kept = RewriteUserConfigTheme(keep, "dark");
    assert(contains(kept, "&quot;width&quot;:&quot;full&quot;"));
    assert(contains(kept, "&quot;theme&quot;:&quot;dark&quot;"));

    // Non-ASCII text is written as UTF-8, not \u escapes.
    const std::string utf8 = "<marimo-user-config data-config=\"" + HtmlEscape("{\"name\":\"caf\xC3\xA9\"}") + "\">";
    assert(contains(RewriteUserConfigTheme(utf8, "dark"), "caf\xC3\xA9"));

    // Short decimals and 64-bit integers are written back as they were read.
    const std::string numbers = "<marimo-user-config data-config=\"" +
                                HtmlEscape("{\"z\":1,\"a\":0.1,\"w\":2.5,\"n\":9007199254740993}") + "\">";
    const std::string renumbered = RewriteUserConfigTheme(numbers, "dark");
    assert(contains(renumbered, "&quot;a&quot;:0.1,"));
    assert(contains(renumbered, "&quot;w&quot;:2.5"));
    assert(contains(renumbered, "&quot;n&quot;:9007199254740993"));
    assert(contains(renumbered, "&quot;z&quot;:1"));

    // Unparseable payloads and non-objects are left exactly as they were.
    const std::string broken = "<marimo-user-config data-config=\"{not json\"></marimo-user-config>";
    assert(RewriteUserConfigTheme(broken, "dark") == broken);
    const std::string array = "<marimo-user-config data-config=\"[1,2]\"></marimo-user-config>";
    assert(RewriteUserConfigTheme(array, "dark") == array);
    const std::string none = "<div data-config=\"{}\"></div>";
    assert(RewriteUserConfigTheme(none, "dark") == none);
    LOG_INFO << "User config theme PASS";
}

void testSanitizeUtf8() {
    assert(SanitizeUtf8("plain") == "plain");
    assert(SanitizeUtf8("caf\xC3\xA9") == "caf\xC3\xA9");
    assert(SanitizeUtf8("a\xFF" "b") == "a\xEF\xBF\xBD" "b");
    // Truncated sequence: one replacement for the maximal invalid subpart.
    assert(SanitizeUtf8("a\xE2\x82") == "a\xEF\xBF\xBD");
    // Overlong and surrogate encodings are rejected.
    assert(SanitizeUtf8("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD");
    assert(SanitizeUtf8("\xED\xA0\x80") == "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");

    const std::string out = RewriteHtml("<head></head><a href=\"/x\xFF\">", kMount);
    assert(contains(out, "href=\"" + kMount + "/x\xEF\xBF\xBD\""));
    LOG_INFO << "SanitizeUtf8 PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testDarkThemeOverride();
    testNoThemeLeavesConfigAlone();
    testBaseInjection();
    testRootRelativeAttributes();
    testMountConfigTheme();
    testUserConfigTheme();
    testSanitizeUtf8();
    return 0;
}
