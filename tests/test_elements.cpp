#include <catch2/catch_test_macros.hpp>
#include "elements.hpp"

using namespace mtsatori;

// ── escaping ─────────────────────────────────────────────────────

TEST_CASE("escape_markup: escapes entities", "[elements]") {
    REQUIRE(escape_markup("a<b>&c") == "a&lt;b&gt;&amp;c");
    REQUIRE(escape_markup("\"q\"") == "\"q\"");
    REQUIRE(escape_markup("\"q\"", true) == "&quot;q&quot;");
}

TEST_CASE("unescape_markup: named and numeric references", "[elements]") {
    REQUIRE(unescape_markup("&lt;&gt;&amp;&quot;&apos;") == "<>&\"'");
    REQUIRE(unescape_markup("&#65;&#x42;") == "AB");
    REQUIRE(unescape_markup("&#x1F600;") == "\xF0\x9F\x98\x80");
}

TEST_CASE("unescape_markup: unknown entity kept literally", "[elements]") {
    REQUIRE(unescape_markup("&nope; & x") == "&nope; & x");
}

TEST_CASE("unescape_markup: references that are not characters stay literal", "[elements]") {
    REQUIRE(unescape_markup("&#x;") == "&#x;");
    REQUIRE(unescape_markup("&#;") == "&#;");
    REQUIRE(unescape_markup("&#0;") == "&#0;");
    REQUIRE(unescape_markup("&#xD800;") == "&#xD800;");
    REQUIRE(unescape_markup("&#57343;") == "&#57343;");
    REQUIRE(unescape_markup("&#x110000;") == "&#x110000;");
    REQUIRE(unescape_markup("&#-65;") == "&#-65;");
    REQUIRE(unescape_markup("&#xD7FF;") == "\xED\x9F\xBF");
}

// ── parse_elements ───────────────────────────────────────────────

TEST_CASE("parse_elements: text and self-closing tag", "[elements]") {
    auto els = parse_elements("hi <at id=\"user:1\"/>!");
    REQUIRE(els.size() == 3);
    REQUIRE(els[0].type == "text");
    REQUIRE(els[0].attr("content") == "hi ");
    REQUIRE(els[1].type == "at");
    REQUIRE(els[1].attr("id") == "user:1");
    REQUIRE(els[2].attr("content") == "!");
}

TEST_CASE("parse_elements: nested children", "[elements]") {
    auto els = parse_elements("<b>x<i>y</i></b>");
    REQUIRE(els.size() == 1);
    REQUIRE(els[0].children.size() == 2);
    REQUIRE(els[0].children[1].type == "i");
}

TEST_CASE("parse_elements: unclosed tags close at end, stray closers ignored", "[elements]") {
    auto els = parse_elements("</i><b>bold");
    REQUIRE(els.size() == 1);
    REQUIRE(els[0].type == "b");
    REQUIRE(els[0].children.size() == 1);
}

TEST_CASE("parse_elements: lone '<' is text", "[elements]") {
    auto els = parse_elements("1 < 2");
    REQUIRE(els.size() == 1);
    REQUIRE(els[0].attr("content") == "1 < 2");
}

TEST_CASE("parse_elements: unquoted and valueless attributes", "[elements]") {
    auto els = parse_elements("<img src=a.png spoiler/>");
    REQUIRE(els.size() == 1);
    REQUIRE(els[0].attr("src") == "a.png");
    REQUIRE(els[0].has_attr("spoiler"));
}

// ── parse_markup ─────────────────────────────────────────────────

TEST_CASE("parse_markup: formatting becomes text styles", "[elements]") {
    auto segs = parse_markup("a<b>b<i>c</i></b>");
    REQUIRE(segs.size() == 3);
    REQUIRE(segs[0].style.plain());
    REQUIRE(segs[1].style.bold);
    REQUIRE_FALSE(segs[1].style.italic);
    REQUIRE(segs[2].style.bold);
    REQUIRE(segs[2].style.italic);
}

TEST_CASE("parse_markup: link and code block", "[elements]") {
    auto segs = parse_markup("<a href=\"https://e.x\">site</a><code-block lang=\"cpp\">int x;</code-block>");
    REQUIRE(segs.size() == 2);
    REQUIRE(segs[0].style.href == "https://e.x");
    REQUIRE(segs[1].style.pre);
    REQUIRE(segs[1].style.language == "cpp");
}

TEST_CASE("parse_markup: media, quote, location and button", "[elements]") {
    auto segs = parse_markup("<quote id=\"message:9\"/><img src=\"https://e.x/a.png\" title=\"a\"/>"
                             "<location lat=\"1.5\" lon=\"-2\"/><button id=\"go\">Go</button>");
    REQUIRE(segs.size() == 4);
    REQUIRE(segs[0].kind == SegmentKind::Quote);
    REQUIRE(segs[0].id == "message:9");
    REQUIRE(segs[1].kind == SegmentKind::Image);
    REQUIRE(segs[1].title == "a");
    REQUIRE(segs[2].latitude == 1.5);
    REQUIRE(segs[2].longitude == -2.0);
    REQUIRE(segs[3].kind == SegmentKind::Button);
    REQUIRE(segs[3].text == "Go");
    REQUIRE(segs[3].button_type == "action");
}

TEST_CASE("parse_markup: media without src is dropped", "[elements]") {
    REQUIRE(parse_markup("<img/>").empty());
}

TEST_CASE("parse_markup: br and paragraphs become newlines", "[elements]") {
    auto segs = parse_markup("a<br/>b<p>c</p>d");
    REQUIRE(segs.size() == 1);
    REQUIRE(segs[0].text == "a\nb\nc\nd");
}

TEST_CASE("parse_markup: unknown elements keep their children", "[elements]") {
    auto segs = parse_markup("<message><custom>x</custom></message><author id=\"1\"/>");
    REQUIRE(segs.size() == 1);
    REQUIRE(segs[0].text == "x");
}

// ── dump_markup ──────────────────────────────────────────────────

TEST_CASE("dump_markup: escapes text and attributes", "[elements]") {
    Segments segs = {seg::text("a<b"), seg::at("user:1", "\"x\"")};
    REQUIRE(dump_markup(segs) == "a&lt;b<at id=\"user:1\" name=\"&quot;x&quot;\"/>");
}

TEST_CASE("dump_markup: output parses back to the same segments", "[elements]") {
    TextStyle st;
    st.bold = true;
    st.href = "https://e.x/?a=1&b=2";
    Segment img = seg::media(SegmentKind::Image, "internal:telegram/1/AgAD", "p.jpg");
    img.spoiler = true;
    Segments segs = {seg::quote("message:4"), seg::text("see ", st), img,
                     seg::location(55.75, 37.6166), seg::button("cb", "Press")};
    REQUIRE(semantically_equal(parse_markup(dump_markup(segs)), segs));
}

TEST_CASE("quote markup carries the quoted author and content", "[elements]") {
    Segment q = seg::quote("message:5");
    q.author_id = "user:2";
    q.text = "Alice";
    q.children = {seg::text("original")};
    std::string markup = dump_markup({q, seg::text("reply")});
    REQUIRE(markup == "<quote id=\"message:5\"><user id=\"user:2\" name=\"Alice\"/>original"
                      "</quote>reply");

    auto segs = parse_markup(markup);
    REQUIRE(segs.size() == 2);
    REQUIRE(segs[0].kind == SegmentKind::Quote);
    REQUIRE(segs[0].id == "message:5");
    REQUIRE(segs[0].author_id == "user:2");
    REQUIRE(segs[0].text == "Alice");
    REQUIRE(segs[0].children.size() == 1);
    REQUIRE(segs[0].children[0].text == "original");
    REQUIRE(segs[1].text == "reply");
}
