#include <QtTest>
#include "lyrics/HtmlText.hpp"

using namespace cal::lyrics;

class TestHtmlText : public QObject {
    Q_OBJECT

private slots:
    void testNamedEntitiesDecoded() {
        QCOMPARE(html::toText("Don&rsquo;t stop &eacute;t&eacute; &hellip;"),
                 std::string("Don\xE2\x80\x99t stop \xC3\xA9t\xC3\xA9 "
                             "\xE2\x80\xA6"));
        QCOMPARE(html::toText("Rock &amp; Roll &#39;n&#x27; &quot;x&quot;"),
                 std::string("Rock & Roll 'n' \"x\""));
        QCOMPARE(html::toText("a&nbsp;b"), std::string("a b"));
    }

    void testLineBreaksAndTags() {
        auto out = html::toText(
                "\n<i>First</i> line<br>\nSecond &amp; more<br/>\n <b>Third</b> ");
        QCOMPARE(out, std::string("First line\nSecond & more\nThird"));
    }

    void testScriptsAreSkipped() {
        auto out = html::toText("Verse<script>var x = 1;</script><br>Chorus");
        QCOMPARE(out, std::string("Verse\nChorus"));
    }

    void testCommentDoesNotCloseBlock() {
        auto blocks = html::selectText(
                "<div data-lyrics-container=\"true\">Line one<!-- </div> -->"
                "<br>Line two</div>",
                "//div[@data-lyrics-container=\"true\"]");
        QCOMPARE(blocks.size(), size_t(1));
        QCOMPARE(blocks[0], std::string("Line one\nLine two"));
    }

    void testNestedBlocks() {
        std::string page =
                "<div class=\"x\">skip</div>"
                "<div data-lyrics-container=\"true\">A<div>inner</div>B</div>"
                "<div data-lyrics-container=\"true\">C</div>";
        auto blocks =
                html::selectText(page, "//div[@data-lyrics-container=\"true\"]");
        QCOMPARE(blocks.size(), size_t(2));
        QCOMPARE(blocks[0], std::string("AinnerB"));
        QCOMPARE(blocks[1], std::string("C"));
    }

    void testExcludedSubtreesDropped() {
        std::string page =
                "<div data-lyrics-container=\"true\">a"
                "<div data-exclude-from-selection=\"true\">b"
                "<span data-exclude-from-selection=\"true\">c</span></div>"
                "d</div>";
        auto blocks =
                html::selectText(page,
                                 "//div[@data-lyrics-container=\"true\"]",
                                 "//*[@data-exclude-from-selection=\"true\"]");
        QCOMPARE(blocks.size(), size_t(1));
        QCOMPARE(blocks[0], std::string("ad"));
    }

    void testUnclosedMarkupRecovers() {
        auto blocks = html::selectText("<div id=\"l\"><i>one<br>two",
                                       "//div[@id=\"l\"]");
        QCOMPARE(blocks.size(), size_t(1));
        QCOMPARE(blocks[0], std::string("one\ntwo"));
    }

    void testNothingToSelect() {
        QVERIFY(html::selectText("", "//div").empty());
        QVERIFY(html::selectText("<p>none</p>", "//div").empty());
        QVERIFY(html::selectText("<div>x</div>", "//div[").empty());
        QCOMPARE(html::toText(""), std::string());
    }
};

int runTestHtmlText(int argc, char** argv) {
    TestHtmlText tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_HtmlText.moc"
