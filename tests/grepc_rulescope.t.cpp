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

#include "grepc_rulescope.h"
#include "grepc_textbuffer.h"

#include <QCoreApplication>
#include <QJsonObject>
#include <QTemporaryDir>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace grepc;

using ::testing::ElementsAre;

namespace {

Rule makeRule(const QString& pattern)
{
    Rule rule = Rule::create(pattern);
    rule.enabled = true;
    rule.pattern = pattern;
    return rule;
}

class RuleScopeTests : public ::testing::Test
{
protected:
    void SetUp() override {
        ASSERT_THAT(d_dir.isValid(), ::testing::IsTrue());
        QString settingsFile = d_dir.filePath("rules.ini");

        d_global = std::make_unique<RuleScope>("global", std::make_unique<SettingsRuleStore>(settingsFile, "global"));
        d_local = std::make_unique<RuleScope>("local", std::make_unique<SettingsRuleStore>(settingsFile, "local"));
    }

    QTemporaryDir d_dir;
    std::unique_ptr<RuleScope> d_global;
    std::unique_ptr<RuleScope> d_local;
};

}

TEST_F(RuleScopeTests, ScopesTrackSideBySide) {
    StringTextBuffer buffer("/tmp/a.txt", "foo bar\nbar foo foo");
    d_global->coordinator()->setActiveBuffer(&buffer);
    d_local->coordinator()->setActiveBuffer(&buffer);

    Rule foo = makeRule("foo");
    Rule bar = makeRule("bar");
    d_global->ruleSet()->addRule(foo);
    d_local->ruleSet()->addRule(bar);
    QCoreApplication::processEvents();

    EXPECT_THAT(d_global->publisher()->occurrenceCount(foo.id), ::testing::Eq(3));
    EXPECT_THAT(d_global->publisher()->occurrenceCount(bar.id), ::testing::Eq(0));
    EXPECT_THAT(d_local->publisher()->occurrenceCount(bar.id), ::testing::Eq(2));
    EXPECT_THAT(d_local->publisher()->occurrenceCount(foo.id), ::testing::Eq(0));

    // Published counts flow back into each scope's own rules
    EXPECT_THAT(d_global->ruleSet()->rule(foo.id)->occurrences, ::testing::Eq(3));
    EXPECT_THAT(d_local->ruleSet()->rule(bar.id)->occurrences, ::testing::Eq(2));

    TextEdit edit = buffer.replace(0, 3, "bar");
    d_global->coordinator()->notifyEdit(buffer.bufferId(), edit);
    d_local->coordinator()->notifyEdit(buffer.bufferId(), edit);

    EXPECT_THAT(d_global->publisher()->occurrences(foo.id), ElementsAre(MatchRange { 12, 15 }, MatchRange { 16, 19 }));
    EXPECT_THAT(d_local->publisher()->occurrences(bar.id),
                ElementsAre(MatchRange { 0, 3 }, MatchRange { 4, 7 }, MatchRange { 8, 11 }));

    // Locking one scope does not hold up the other
    d_global->ruleSet()->removeRule(foo.id);
    EXPECT_THAT(d_global->ruleSet()->isLocked(), ::testing::IsTrue());
    edit = buffer.replace(4, 7, "baz");
    d_global->coordinator()->notifyEdit(buffer.bufferId(), edit);
    d_local->coordinator()->notifyEdit(buffer.bufferId(), edit);
    EXPECT_THAT(d_local->publisher()->occurrenceCount(bar.id), ::testing::Eq(2));

    QCoreApplication::processEvents();
    EXPECT_THAT(d_global->coordinator()->enabledRules(), ::testing::IsEmpty());
    ASSERT_THAT(d_local->coordinator()->enabledRules(), ::testing::SizeIs(1));
    EXPECT_THAT(d_local->coordinator()->enabledRules().at(0).id, ::testing::Eq(bar.id));
}

TEST_F(RuleScopeTests, Json) {
    StringTextBuffer buffer("/tmp/a.txt", "foo\nfoo");
    d_global->coordinator()->setActiveBuffer(&buffer);

    Rule foo = makeRule("foo");
    Rule broken = makeRule("a[");
    Rule disabled = makeRule("o");
    disabled.enabled = false;
    d_global->trackRules({ foo, broken, disabled });

    QJsonArray rules = d_global->toJson();
    ASSERT_THAT(rules.size(), ::testing::Eq(2));

    QJsonObject first = rules.at(0).toObject();
    EXPECT_THAT(first.value("scope").toString(), ::testing::Eq(QStringLiteral("global")));
    EXPECT_THAT(first.value("id").toString(), ::testing::Eq(foo.id));
    EXPECT_THAT(first.value("count").toInt(), ::testing::Eq(2));
    EXPECT_THAT(first.value("occurrences").toArray().size(), ::testing::Eq(2));
    EXPECT_THAT(first.contains("error"), ::testing::IsFalse());

    QJsonObject second = rules.at(1).toObject();
    EXPECT_THAT(second.value("count").toInt(), ::testing::Eq(0));
    EXPECT_THAT(second.value("error").toString(), ::testing::Not(::testing::IsEmpty()));

    EXPECT_THAT(d_local->toJson(), ::testing::IsEmpty());
}
