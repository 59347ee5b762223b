/*
 * This file is part of Grepc
 * Copyright (c) 2026 Grepc contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */
#include "grepc_testutils.h"

#include "grepc_rescanengine.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace grepc;

using ::testing::ElementsAre;

namespace {

Rule makeRule(const QString& pattern, const QString& flags = QStringLiteral("g"), std::optional<int> cap = 1000)
{
    Rule rule = Rule::create(QStringLiteral("test"));
    rule.enabled = true;
    rule.pattern = pattern;
    rule.patternFlags = flags;
    rule.maxOccurrences = cap;
    return rule;
}

MatchRangeList fullScan(const RescanEngine& engine, const TextBuffer& buffer)
{
    IntervalStore store;
    engine.rebuild(store, buffer);
    return store.ranges();
}

// Small deterministic generator so edit sequences are reproducible
class EditGenerator
{
public:
    explicit EditGenerator(unsigned seed) : d_state(seed) {}

    int next(int bound) {
        d_state = d_state * 1103515245u + 12345u;
        return static_cast<int>((d_state >> 16) % static_cast<unsigned>(bound));
    }

    QString text(const QString& alphabet, int maxLength) {
        QString result;
        int length = next(maxLength + 1);
        for (int i = 0; i < length; i++) {
            result.append(alphabet.at(next(static_cast<int>(alphabet.size()))));
        }
        return result;
    }

private:
    unsigned d_state;
};

void checkRandomEdits(const Rule& rule, const QString& initialText, const QString& alphabet, unsigned seed)
{
    RescanEngine engine(rule, Rule::DEFAULT_MAX_OCCURRENCES);
    ASSERT_THAT(engine.isValid(), ::testing::IsTrue());

    StringTextBuffer buffer("/tmp/random.txt", initialText);
    IntervalStore store;
    engine.rebuild(store, buffer);

    EditGenerator gen(seed);
    for (int step = 0; step < 300; step++) {
        int from = gen.next(buffer.length() + 1);
        int to = std::min(buffer.length(), from + gen.next(4));
        QString text = gen.text(alphabet, 3);

        TextEdit edit = buffer.replace(from, to, text);
        RescanResult result = engine.update(store, edit, buffer);

        SCOPED_TRACE(QStringLiteral("step %1, text \"%2\"").arg(step).arg(buffer.text()).toStdString());
        ASSERT_THAT(result.valid, ::testing::IsTrue());
        ASSERT_THAT(store.isConsistent(), ::testing::IsTrue());
        ASSERT_THAT(store.ranges(), ::testing::Eq(fullScan(engine, buffer)));
        ASSERT_THAT(result.count, ::testing::Eq(store.size()));
    }
}

}

TEST(RescanEngineTests, InitialScan) {
    RescanEngine engine(makeRule("foo"), 1000);
    StringTextBuffer buffer("/tmp/a.txt", "foo bar foo");

    IntervalStore store;
    RescanResult result = engine.rebuild(store, buffer);

    EXPECT_THAT(result.valid, ::testing::IsTrue());
    EXPECT_THAT(result.rebuilt, ::testing::IsTrue());
    EXPECT_THAT(result.count, ::testing::Eq(2));
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 3 }, MatchRange { 8, 11 }));
}

TEST(RescanEngineTests, ReplaceBetweenMatches) {
    RescanEngine engine(makeRule("foo"), 1000);
    StringTextBuffer buffer("/tmp/a.txt", "foo bar foo");

    IntervalStore store;
    engine.rebuild(store, buffer);

    TextEdit edit = buffer.replace(4, 7, "barbaz");
    ASSERT_THAT(buffer.text(), ::testing::Eq(QStringLiteral("foo barbaz foo")));

    RescanResult result = engine.update(store, edit, buffer);
    EXPECT_THAT(result.rebuilt, ::testing::IsFalse());
    EXPECT_THAT(result.count, ::testing::Eq(2));
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 3 }, MatchRange { 11, 14 }));
    EXPECT_THAT(store.ranges(), ::testing::Eq(fullScan(engine, buffer)));
}

TEST(RescanEngineTests, CapRespected) {
    RescanEngine engine(makeRule("a", "g", 1), 1000);
    StringTextBuffer buffer("/tmp/a.txt", "aaa");

    IntervalStore store;
    engine.rebuild(store, buffer);
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 1 }));

    TextEdit edit = buffer.replace(3, 3, "aaa");
    engine.update(store, edit, buffer);
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 1 }));

    edit = buffer.replace(0, 0, "b");
    engine.update(store, edit, buffer);
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 1, 2 }));
}

TEST(RescanEngineTests, DefaultCap) {
    Rule rule = makeRule("a", "g", std::nullopt);
    RescanEngine engine(rule, 2);
    EXPECT_THAT(engine.cap(), ::testing::Eq(2));

    StringTextBuffer buffer("/tmp/a.txt", "aaaa");
    IntervalStore store;
    engine.rebuild(store, buffer);
    EXPECT_THAT(store.size(), ::testing::Eq(2));
}

TEST(RescanEngineTests, SaturatedStoreRefills) {
    RescanEngine engine(makeRule("a", "g", 2), 1000);
    StringTextBuffer buffer("/tmp/a.txt", "a\nb\na\na");

    IntervalStore store;
    engine.rebuild(store, buffer);
    ASSERT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 1 }, MatchRange { 4, 5 }));

    TextEdit edit = buffer.replace(0, 1, "b");
    RescanResult result = engine.update(store, edit, buffer);

    EXPECT_THAT(result.rebuilt, ::testing::IsTrue());
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 4, 5 }, MatchRange { 6, 7 }));
}

TEST(RescanEngineTests, EditFarFromMatches) {
    RescanEngine engine(makeRule("foo"), 1000);
    StringTextBuffer buffer("/tmp/a.txt", "foo\n\n\nbar foo");

    IntervalStore store;
    engine.rebuild(store, buffer);
    ASSERT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 3 }, MatchRange { 10, 13 }));

    TextEdit edit = buffer.replace(5, 5, "xyz");
    RescanResult result = engine.update(store, edit, buffer);

    EXPECT_THAT(result.removed, ::testing::Eq(0));
    EXPECT_THAT(result.inserted, ::testing::Eq(0));
    EXPECT_THAT(result.count, ::testing::Eq(2));
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 3 }, MatchRange { 13, 16 }));
}

TEST(RescanEngineTests, InsertThenDeleteConverges) {
    RescanEngine engine(makeRule("fo+"), 1000);
    StringTextBuffer buffer("/tmp/a.txt", "foo bar foo\nbaz fooo");

    IntervalStore initial;
    engine.rebuild(initial, buffer);

    IntervalStore store = initial;

    TextEdit insert = buffer.replace(4, 4, "foo\nfo ");
    engine.update(store, insert, buffer);
    EXPECT_THAT(store.ranges(), ::testing::Eq(fullScan(engine, buffer)));
    EXPECT_THAT(store.size(), ::testing::Eq(5));

    TextEdit remove = buffer.replace(4, 11, QString());
    engine.update(store, remove, buffer);
    EXPECT_THAT(store.ranges(), ::testing::Eq(initial.ranges()));
}

TEST(RescanEngineTests, DeletedLineBreak) {
    RescanEngine engine(makeRule("bc"), 1000);
    StringTextBuffer buffer("/tmp/a.txt", "ab\ncd\nbc");

    IntervalStore store;
    engine.rebuild(store, buffer);
    ASSERT_THAT(store.ranges(), ElementsAre(MatchRange { 6, 8 }));

    TextEdit edit = buffer.replace(2, 3, QString());
    engine.update(store, edit, buffer);
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 1, 3 }, MatchRange { 5, 7 }));

    edit = buffer.replace(2, 2, "\n");
    engine.update(store, edit, buffer);
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 6, 8 }));
}

TEST(RescanEngineTests, MatchRunningPastWindow) {
    RescanEngine engine(makeRule("a[^z]*z|b"), 1000);
    StringTextBuffer buffer("/tmp/a.txt", "q\nb\nbz");

    IntervalStore store;
    engine.rebuild(store, buffer);
    ASSERT_THAT(store.ranges(), ElementsAre(MatchRange { 2, 3 }, MatchRange { 4, 5 }));

    TextEdit edit = buffer.replace(0, 1, "a");
    engine.update(store, edit, buffer);
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 6 }));
    EXPECT_THAT(store.isConsistent(), ::testing::IsTrue());

    edit = buffer.replace(0, 1, "q");
    engine.update(store, edit, buffer);
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 2, 3 }, MatchRange { 4, 5 }));
}

TEST(RescanEngineTests, MatchEndingOnEditedLine) {
    RescanEngine engine(makeRule("foo\\nbar"), 1000);
    StringTextBuffer buffer("/tmp/a.txt", "foo\nbaz");

    IntervalStore store;
    engine.rebuild(store, buffer);
    ASSERT_THAT(store.isEmpty(), ::testing::IsTrue());

    TextEdit edit = buffer.replace(4, 7, "bar");
    RescanResult result = engine.update(store, edit, buffer);
    EXPECT_THAT(result.inserted, ::testing::Eq(1));
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 7 }));
    EXPECT_THAT(store.ranges(), ::testing::Eq(fullScan(engine, buffer)));

    // Completed in the middle of the second line
    buffer.setText("foo\nbaX");
    engine.rebuild(store, buffer);
    ASSERT_THAT(store.isEmpty(), ::testing::IsTrue());

    edit = buffer.replace(6, 7, "r");
    engine.update(store, edit, buffer);
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 7 }));
}

TEST(RescanEngineTests, MatchStartingLinesBeforeEdit) {
    RescanEngine engine(makeRule("b\\n+c"), 1000);
    StringTextBuffer buffer("/tmp/a.txt", "b\n\n\n\nx");

    IntervalStore store;
    engine.rebuild(store, buffer);
    ASSERT_THAT(store.isEmpty(), ::testing::IsTrue());

    TextEdit edit = buffer.replace(5, 6, "c");
    engine.update(store, edit, buffer);
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 6 }));

    edit = buffer.replace(5, 6, "y");
    engine.update(store, edit, buffer);
    EXPECT_THAT(store.isEmpty(), ::testing::IsTrue());
}

TEST(RescanEngineTests, MatchRunningPastSearchedLines) {
    RescanEngine engine(makeRule("b\\n+c|x"), 1000);
    StringTextBuffer buffer("/tmp/a.txt", QStringLiteral("a") + QString(40, QLatin1Char('\n')) + QStringLiteral("c x"));

    IntervalStore store;
    engine.rebuild(store, buffer);
    ASSERT_THAT(store.ranges(), ElementsAre(MatchRange { 43, 44 }));

    TextEdit edit = buffer.replace(0, 1, "b");
    engine.update(store, edit, buffer);
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 42 }, MatchRange { 43, 44 }));

    edit = buffer.replace(0, 1, "a");
    engine.update(store, edit, buffer);
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 43, 44 }));
}

TEST(RescanEngineTests, PatternFlags) {
    RescanEngine engine(makeRule("^foo", "gim"), 1000);
    StringTextBuffer buffer("/tmp/a.txt", "Foo\nbar\nFOO foo");

    IntervalStore store;
    engine.rebuild(store, buffer);
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 3 }, MatchRange { 8, 11 }));

    TextEdit edit = buffer.replace(4, 4, "foo");
    engine.update(store, edit, buffer);
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 3 }, MatchRange { 4, 7 }, MatchRange { 11, 14 }));
}

TEST(RescanEngineTests, InvalidPattern) {
    RescanEngine engine(makeRule("(foo"), 1000);
    EXPECT_THAT(engine.isValid(), ::testing::IsFalse());
    EXPECT_THAT(engine.errorString(), ::testing::Not(::testing::IsEmpty()));

    StringTextBuffer buffer("/tmp/a.txt", "foo");
    IntervalStore store;
    RescanResult result = engine.rebuild(store, buffer);
    EXPECT_THAT(result.valid, ::testing::IsFalse());
    EXPECT_THAT(result.count, ::testing::Eq(0));
    EXPECT_THAT(store.isEmpty(), ::testing::IsTrue());

    TextEdit edit = buffer.replace(0, 0, "x");
    result = engine.update(store, edit, buffer);
    EXPECT_THAT(result.valid, ::testing::IsFalse());
    EXPECT_THAT(store.isEmpty(), ::testing::IsTrue());
}

TEST(RescanEngineTests, InvalidFlags) {
    RescanEngine engine(makeRule("foo", "gq"), 1000);
    EXPECT_THAT(engine.isValid(), ::testing::IsFalse());
}

TEST(RescanEngineTests, EmptyPattern) {
    RescanEngine engine(makeRule(QString()), 1000);
    EXPECT_THAT(engine.cap(), ::testing::Eq(0));

    StringTextBuffer buffer("/tmp/a.txt", "anything");
    IntervalStore store;
    engine.rebuild(store, buffer);
    EXPECT_THAT(store.isEmpty(), ::testing::IsTrue());
}

TEST(RescanEngineTests, DisagreeingEditRebuilds) {
    RescanEngine engine(makeRule("foo"), 1000);
    StringTextBuffer buffer("/tmp/a.txt", "foo");

    IntervalStore store;
    engine.rebuild(store, buffer);

    // Two edits happen, but only the second is reported
    buffer.replace(0, 0, "foo ");
    TextEdit edit = buffer.replace(0, 0, "foo ");

    RescanResult result = engine.update(store, edit, buffer);
    EXPECT_THAT(result.rebuilt, ::testing::IsTrue());
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 3 }, MatchRange { 4, 7 }, MatchRange { 8, 11 }));
}

TEST(RescanEngineTests, ZeroWidthMatches) {
    RescanEngine engine(makeRule("^", "gm"), 1000);
    StringTextBuffer buffer("/tmp/a.txt", "a\nb\nc");

    IntervalStore store;
    engine.rebuild(store, buffer);
    ASSERT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 0 }, MatchRange { 2, 2 }, MatchRange { 4, 4 }));

    TextEdit edit = buffer.replace(1, 2, QString());
    engine.update(store, edit, buffer);
    EXPECT_THAT(store.ranges(), ElementsAre(MatchRange { 0, 0 }, MatchRange { 3, 3 }));

    edit = buffer.replace(3, 3, "x\ny\n");
    engine.update(store, edit, buffer);
    EXPECT_THAT(store.ranges(), ::testing::Eq(fullScan(engine, buffer)));
}

TEST(RescanEngineTests, RandomEditsMatchFullScan) {
    checkRandomEdits(makeRule("ab+|c"), "abbb c ab\nc\n\nabc", "abc \n", 1);
    checkRandomEdits(makeRule("\\bfoo\\b"), "foo xfoo foo\nfoo", "fox \n", 2);
    checkRandomEdits(makeRule("^", "gm"), "x\ny\n\nz", "xy\n", 3);
}

TEST(RescanEngineTests, RandomEditsMultiLinePatterns) {
    checkRandomEdits(makeRule("foo\\nbar"), "foo\nbar foo\nbaz\nfoo\nbar", "fobar\n", 5);
    checkRandomEdits(makeRule("b\\n+c"), "b\n\nc b\nc\n\nb\n", "bc\n", 6);
    checkRandomEdits(makeRule("(?<=\\n)x"), "x\nx y\n\nxx", "x\ny", 7);
}

TEST(RescanEngineTests, RandomEditsWithCap) {
    checkRandomEdits(makeRule("a|bb", "g", 3), "a bb a\nbb a", "ab \n", 4);
}
