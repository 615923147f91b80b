#include "regex/Regex.h"
#include <gtest/gtest.h>
#include <cstring>
#include <random>
#include <string>

namespace {

// Overall match as text, or "<none>".
std::string find(const char *pattern, const char *text, int flags = REDFLT_STANDARD) {
	Regex re(pattern, flags);
	std::unique_ptr<RegexMatch> m = re.ExecRE(text, nullptr);
	if (!m->matched()) {
		return "<none>";
	}
	return m->captured(0).toStdString();
}

std::string randomPattern(std::mt19937 &rng, int depth) {
	static const char *const quantifiers[] = {"*", "+", "?", "{0,2}", "*?", "+?"};

	switch (rng() % (depth > 3 ? 3 : 7)) {
	case 0:
		return "a";
	case 1:
		return "b";
	case 2:
		return ".";
	case 3:
		return "(" + randomPattern(rng, depth + 1) + ")";
	case 4:
		return randomPattern(rng, depth + 1) + randomPattern(rng, depth + 1);
	case 5:
		return randomPattern(rng, depth + 1) + "|" + randomPattern(rng, depth + 1);
	default:
		return "(?:" + randomPattern(rng, depth + 1) + ")" + quantifiers[rng() % 6];
	}
}

}

TEST(RegexMatchTest, LiteralSpan) {
	Regex re("abc", REDFLT_STANDARD);
	std::unique_ptr<RegexMatch> m = re.ExecRE("xxabcxx", nullptr);
	ASSERT_TRUE(m->matched());
	EXPECT_EQ(2, m->startOffset(0));
	EXPECT_EQ(5, m->endOffset(0));
	EXPECT_EQ(0u, m->captureCount());
}

TEST(RegexMatchTest, Anchors) {
	EXPECT_EQ("abc", find("^abc$", "abc"));
	EXPECT_EQ("<none>", find("^abc$", "xabc"));
	EXPECT_EQ("<none>", find("^abc$", "abcx"));
	EXPECT_EQ("<none>", find("a^b", "ab"));

	Regex re("$", REDFLT_STANDARD);
	std::unique_ptr<RegexMatch> m = re.ExecRE("abc", nullptr);
	ASSERT_TRUE(m->matched());
	EXPECT_EQ(3, m->startOffset(0));
	EXPECT_EQ(3, m->endOffset(0));
}

TEST(RegexMatchTest, StarAtFirstOffset) {
	Regex re("a*", REDFLT_STANDARD);

	std::unique_ptr<RegexMatch> m = re.ExecRE("aaab", nullptr);
	ASSERT_TRUE(m->matched());
	EXPECT_EQ(0, m->startOffset(0));
	EXPECT_EQ(3, m->endOffset(0));

	m = re.ExecRE("baaa", nullptr);
	ASSERT_TRUE(m->matched());
	EXPECT_EQ(0, m->startOffset(0));
	EXPECT_EQ(0, m->endOffset(0));
}

TEST(RegexMatchTest, AlternationCapture) {
	Regex re("(cat|dog)", REDFLT_STANDARD);
	std::unique_ptr<RegexMatch> m = re.ExecRE("I have a dog", nullptr);
	ASSERT_TRUE(m->matched());
	EXPECT_EQ(QByteArray("dog"), m->captured(0));
	EXPECT_EQ(QByteArray("dog"), m->captured(1));
	EXPECT_EQ(9, m->startOffset(1));
	EXPECT_EQ(12, m->endOffset(1));
}

TEST(RegexMatchTest, AlternationIsLeftmostFirst) {
	EXPECT_EQ("a", find("a|ab", "ab"));
	EXPECT_EQ("ab", find("ab|a", "ab"));
}

TEST(RegexMatchTest, BackReference) {
	EXPECT_EQ("hello hello", find("(\\w+) \\1", "hello hello"));
	EXPECT_EQ("<none>", find("(\\w+) \\1", "hello world"));
	EXPECT_EQ("aA", find("(a)\\1", "aA", REDFLT_CASE_INSENSITIVE));
	EXPECT_EQ("<none>", find("(a)\\1", "aA"));
}

TEST(RegexMatchTest, BackReferenceToUnsetGroupFails) {
	EXPECT_EQ("<none>", find("(a)?b\\1", "b"));
	EXPECT_EQ("aba", find("(a)?b\\1", "aba"));
}

TEST(RegexMatchTest, NegatedClass) {
	EXPECT_EQ("abc", find("[^0-9]+", "abc123"));
	EXPECT_EQ("123", find("\\d+", "ab123"));
	EXPECT_EQ(" ", find("\\s", "a b"));
	EXPECT_EQ("-", find("\\W", "ab-c"));
}

TEST(RegexMatchTest, CountedRepetition) {
	EXPECT_EQ("aaa", find("a{2,3}", "aaaa"));
	EXPECT_EQ("aa", find("a{2}", "aaaa"));
	EXPECT_EQ("<none>", find("a{2}", "ab"));
	EXPECT_EQ("ababab", find("(ab){2,}", "abababx"));
	EXPECT_EQ("b", find("a{0}b", "ab"));
}

TEST(RegexMatchTest, LazyQuantifiers) {
	EXPECT_EQ("a", find("a+?", "aaa"));
	EXPECT_EQ("", find("a*?", "aaa"));
	EXPECT_EQ("<a>", find("<.+?>", "<a><b>"));
	EXPECT_EQ("<a><b>", find("<.+>", "<a><b>"));
	EXPECT_EQ("aa", find("a{2,4}?", "aaaa"));
	EXPECT_EQ("ababc", find("(ab)*?c", "ababc"));
	EXPECT_EQ("xab", find("x(?:ab)+?", "xabab"));
}

TEST(RegexMatchTest, GreedyBacktracking) {
	EXPECT_EQ("axxbyyb", find("a.*b", "axxbyybzz"));
	EXPECT_EQ("abcd", find("(a|ab)(c|bcd)(d*)", "abcd"));
	EXPECT_EQ("foobar", find("(?:fo|foo)bar", "foobar"));
}

TEST(RegexMatchTest, CaptureKeepsLastIteration) {
	Regex re("(ab)*", REDFLT_STANDARD);
	std::unique_ptr<RegexMatch> m = re.ExecRE("ababx", nullptr);
	ASSERT_TRUE(m->matched());
	EXPECT_EQ(QByteArray("abab"), m->captured(0));
	EXPECT_EQ(2, m->startOffset(1));
	EXPECT_EQ(4, m->endOffset(1));

	Regex alt("(a|b)*c", REDFLT_STANDARD);
	m = alt.ExecRE("abc", nullptr);
	ASSERT_TRUE(m->matched());
	EXPECT_EQ(QByteArray("b"), m->captured(1));
}

TEST(RegexMatchTest, FailedBranchLeavesGroupUnset) {
	Regex re("(a)|b", REDFLT_STANDARD);
	std::unique_ptr<RegexMatch> m = re.ExecRE("b", nullptr);
	ASSERT_TRUE(m->matched());
	EXPECT_FALSE(m->isSet(1));
	EXPECT_EQ(-1, m->startOffset(1));
	EXPECT_EQ(-1, m->endOffset(1));
	EXPECT_TRUE(m->captured(1).isNull());
	EXPECT_TRUE(m->capture(1).start == nullptr);

	Regex nested("(x(y)|xz)", REDFLT_STANDARD);
	m = nested.ExecRE("xz", nullptr);
	ASSERT_TRUE(m->matched());
	EXPECT_EQ(QByteArray("xz"), m->captured(1));
	EXPECT_FALSE(m->isSet(2));
}

TEST(RegexMatchTest, ZeroLengthIterationEndsRepetition) {
	EXPECT_EQ("", find("(a*)*", "b"));
	EXPECT_EQ("aaa", find("(a*)+", "aaa"));
	EXPECT_EQ("aaab", find("(a*)*b", "aaab"));
	EXPECT_EQ("", find("()*", "x"));
	EXPECT_EQ("", find("(a?){3}", ""));
	EXPECT_EQ("x", find("(?:$|x)*x", "x"));
}

TEST(RegexMatchTest, CaseInsensitive) {
	EXPECT_EQ("HeLLo", find("hello", "say HeLLo", REDFLT_CASE_INSENSITIVE));
	EXPECT_EQ("ABC", find("[a-c]+", "ABC", REDFLT_CASE_INSENSITIVE));
	EXPECT_EQ("aBc", find("a(?ib)c", "aBc"));
	EXPECT_EQ("<none>", find("a(?ib)c", "ABc"));
	EXPECT_EQ("Ab", find("a(?Ib)", "Ab", REDFLT_CASE_INSENSITIVE));
	EXPECT_EQ("<none>", find("a(?Ib)", "AB", REDFLT_CASE_INSENSITIVE));
}

TEST(RegexMatchTest, DotDoesNotMatchNewline) {
	EXPECT_EQ("<none>", find("a.b", "a\nb"));
	EXPECT_EQ("a-b", find("a.b", "a-b"));
	EXPECT_EQ("<none>", find("a[^x]b", "a\nb"));
}

TEST(RegexMatchTest, ExplicitEnd) {
	const char text[] = "abcdef";
	Regex four("abcd", REDFLT_STANDARD);
	EXPECT_FALSE(four.ExecRE(text, text + 3)->matched());

	Regex tail("c$", REDFLT_STANDARD);
	std::unique_ptr<RegexMatch> m = tail.ExecRE(text, text + 3);
	ASSERT_TRUE(m->matched());
	EXPECT_EQ(2, m->startOffset(0));
}

TEST(RegexMatchTest, SearchFromOffset) {
	const char text[] = "abcabc";
	Regex re("abc", REDFLT_STANDARD);
	RegexMatch m(&re);

	ASSERT_TRUE(m.ExecRE(text, nullptr, text + 1));
	EXPECT_EQ(3, m.startOffset(0));
	EXPECT_FALSE(m.ExecRE(text, nullptr, text + 4));

	Regex anchored("^abc", REDFLT_STANDARD);
	RegexMatch a(&anchored);
	EXPECT_TRUE(a.ExecRE(text, nullptr, text));
	EXPECT_FALSE(a.ExecRE(text, nullptr, text + 3));
}

TEST(RegexMatchTest, EmptyPatternMatchesEverywhere) {
	Regex re("", REDFLT_STANDARD);
	std::unique_ptr<RegexMatch> m = re.ExecRE("", nullptr);
	ASSERT_TRUE(m->matched());
	EXPECT_EQ(0, m->endOffset(0));
}

TEST(RegexMatchTest, SameResultForSamePattern) {
	const char text[] = "xx ab12 ab34 yy";
	Regex first("(ab)(\\d+)", REDFLT_STANDARD);
	Regex second("(ab)(\\d+)", REDFLT_STANDARD);

	std::unique_ptr<RegexMatch> m1 = first.ExecRE(text, nullptr);
	std::unique_ptr<RegexMatch> m2 = second.ExecRE(text, nullptr);
	ASSERT_TRUE(m1->matched());
	ASSERT_TRUE(m2->matched());

	for (size_t i = 0; i <= first.captureCount(); ++i) {
		EXPECT_EQ(m1->startOffset(i), m2->startOffset(i));
		EXPECT_EQ(m1->endOffset(i), m2->endOffset(i));
	}
}

TEST(RegexMatchTest, StepLimitStopsCatastrophicBacktracking) {
	const std::string text(30, 'a');
	Regex re("(a*)*b", REDFLT_STANDARD);
	RegexMatch m(&re);
	m.setStepLimit(10000);

	EXPECT_FALSE(m.ExecRE(text.c_str(), nullptr));
	EXPECT_TRUE(m.limitExceeded());
	EXPECT_FALSE(m.matched());
	EXPECT_FALSE(m.isSet(0));

	// Small enough to run to completion without a limit.
	const std::string shortText(8, 'a');
	m.setStepLimit(0);
	EXPECT_FALSE(m.ExecRE(shortText.c_str(), nullptr));
	EXPECT_FALSE(m.limitExceeded());

	const std::string matching = shortText + "b";
	EXPECT_TRUE(m.ExecRE(matching.c_str(), nullptr));
	EXPECT_FALSE(m.limitExceeded());
}

TEST(RegexMatchTest, DefaultStepLimitApplies) {
	Regex re("a", REDFLT_STANDARD);
	RegexMatch m(&re);
	EXPECT_EQ(RegexMatch::DefaultStepLimit, m.stepLimit());
}

TEST(RegexMatchTest, LongLinesRepeatGroups) {
	std::string text;
	for (int i = 0; i < 5000; ++i) {
		text += "ab";
	}

	Regex re("(?:ab)*$", REDFLT_STANDARD);
	RegexMatch m(&re);
	ASSERT_TRUE(m.ExecRE(text.c_str(), nullptr));
	EXPECT_FALSE(m.limitExceeded());
	EXPECT_EQ(0, m.startOffset(0));
	EXPECT_EQ(10000, m.endOffset(0));

	// Every iteration leaves a branch point behind.
	const std::string branches = std::string(4000, 'a') + "c";
	Regex alt("(a|b)*c", REDFLT_STANDARD);
	RegexMatch a(&alt);
	ASSERT_TRUE(a.ExecRE(branches.c_str(), nullptr));
	EXPECT_EQ(static_cast<long>(branches.size()), a.endOffset(0));
	EXPECT_EQ(3999, a.startOffset(1));

	const std::string run(100000, 'a');
	Regex simple("a*$", REDFLT_STANDARD);
	RegexMatch s(&simple);
	EXPECT_TRUE(s.ExecRE(run.c_str(), nullptr));
	EXPECT_EQ(static_cast<long>(run.size()), s.endOffset(0));
}

TEST(RegexMatchTest, StepLimitIsPerStartPosition) {
	const std::string text = std::string(600000, 'x') + "1";

	Regex re("\\d", REDFLT_STANDARD);
	RegexMatch m(&re);
	ASSERT_TRUE(m.ExecRE(text.c_str(), nullptr));
	EXPECT_FALSE(m.limitExceeded());
	EXPECT_EQ(600000, m.startOffset(0));
	EXPECT_EQ(600001, m.endOffset(0));

	// A budget far below the line length still finds it.
	m.setStepLimit(100);
	EXPECT_TRUE(m.ExecRE(text.c_str(), nullptr));
	EXPECT_EQ(600000, m.startOffset(0));
}

TEST(RegexMatchTest, DotMatchesOneCharacter) {
	// U+00E9 is two bytes, U+20AC three, U+1F600 four.
	EXPECT_EQ("\xc3\xa9", find("^.$", "\xc3\xa9"));
	EXPECT_EQ("a\xe2\x82\xac" "b", find("a.b", "a\xe2\x82\xac" "b"));
	EXPECT_EQ("\xf0\x9f\x98\x80", find("^.$", "\xf0\x9f\x98\x80"));
	EXPECT_EQ("<none>", find("^..$", "\xc3\xa9"));
	EXPECT_EQ("\xc3\xa9\xc3\xa9", find("^.{2}$", "\xc3\xa9\xc3\xa9"));

	Regex re(".", REDFLT_STANDARD);
	std::unique_ptr<RegexMatch> m = re.ExecRE("\xc3\xa9", nullptr);
	ASSERT_TRUE(m->matched());
	EXPECT_EQ(2, m->captured(0).size());

	// Offsets are byte offsets.
	m = re.ExecRE("\n\xe2\x82\xac", nullptr);
	ASSERT_TRUE(m->matched());
	EXPECT_EQ(1, m->startOffset(0));
	EXPECT_EQ(4, m->endOffset(0));
}

TEST(RegexMatchTest, MultiByteClassesAndLiterals) {
	EXPECT_EQ("\xc3\xa9", find("[\xc3\xa9]", "x\xc3\xa9"));
	EXPECT_EQ("<none>", find("[\xc3\xa9]", "\xc3\xa8"));
	EXPECT_EQ("\xce\xb2\xce\xb3", find("[\xce\xb1-\xcf\x89]+", "a\xce\xb2\xce\xb3z"));
	EXPECT_EQ("z", find("[^\xc3\xa9]", "\xc3\xa9z"));
	EXPECT_EQ("\xc3\xa9", find("\\W", "a\xc3\xa9"));
	EXPECT_EQ("\xe4\xb8\xad", find("[\\D]", "1\xe4\xb8\xad"));
	EXPECT_EQ("\xc3\xa9", find("\\xe9", "\xc3\xa9"));
	EXPECT_EQ("\xc3\xa9\xc3\xa9", find("(\xc3\xa9)\\1", "\xc3\xa9\xc3\xa9"));
}

TEST(RegexMatchTest, MultiByteBacktracking) {
	EXPECT_EQ("a\xc3\xa9x\xc3\xa9", find(".*\xc3\xa9", "a\xc3\xa9x\xc3\xa9" "b"));
	EXPECT_EQ("\xe2\x82\xac\xe2\x82\xac", find(".+\xe2\x82\xac", "\xe2\x82\xac\xe2\x82\xac"));
	EXPECT_EQ("\xc3\xa9", find("\xc3\xa9+?", "\xc3\xa9\xc3\xa9\xc3\xa9"));
	EXPECT_EQ("\xc3\xa9" "a", find(".*?a", "\xc3\xa9" "a"));
}

TEST(RegexMatchTest, CaseInsensitiveBeyondAscii) {
	EXPECT_EQ("\xc3\x89", find("\xc3\xa9", "\xc3\x89", REDFLT_CASE_INSENSITIVE));
	EXPECT_EQ("\xc3\xa9", find("\xc3\x89", "\xc3\xa9", REDFLT_CASE_INSENSITIVE));
	EXPECT_EQ("\xc3\x80\xc3\x89", find("[\xc3\xa0-\xc3\xbf]+", "\xc3\x80\xc3\x89", REDFLT_CASE_INSENSITIVE));
	EXPECT_EQ("\xce\xa3", find("\xcf\x83", "\xce\xa3", REDFLT_CASE_INSENSITIVE));
	EXPECT_EQ("<none>", find("\xc3\xa9", "\xc3\x89"));
}

TEST(RegexMatchTest, InvalidBytesAreCharacters) {
	EXPECT_EQ("\xff", find("^.$", "\xff"));
	EXPECT_EQ("\xc3", find("^.$", "\xc3"));
	EXPECT_EQ("\xff", find("\xff", "a\xff"));
	EXPECT_EQ("<none>", find("\\xff", "\xff"));

	// A truncated sequence is one character per byte.
	EXPECT_EQ("\xe2\x82", find("^..$", "\xe2\x82"));
}

TEST(RegexMatchTest, RandomPatternsTerminate) {
	std::mt19937 rng(12345);

	for (int i = 0; i < 500; ++i) {
		const std::string pattern = randomPattern(rng, 0);

		std::string text;
		const size_t length = rng() % 24;
		for (size_t j = 0; j < length; ++j) {
			text += "abc"[rng() % 3];
		}

		std::unique_ptr<Regex> re;
		try {
			re.reset(new Regex(pattern.c_str(), REDFLT_STANDARD));
		} catch (const RegexException &e) {
			FAIL() << pattern << ": " << e.what();
		}

		RegexMatch first(re.get());
		RegexMatch second(re.get());
		const bool matched = first.ExecRE(text.c_str(), nullptr);

		EXPECT_EQ(matched, second.ExecRE(text.c_str(), nullptr)) << pattern << " on " << text;
		EXPECT_EQ(first.limitExceeded(), second.limitExceeded());

		if (matched) {
			EXPECT_LE(0, first.startOffset(0));
			EXPECT_LE(first.startOffset(0), first.endOffset(0));
			EXPECT_LE(first.endOffset(0), static_cast<long>(text.size()));
			EXPECT_EQ(first.startOffset(0), second.startOffset(0)) << pattern << " on " << text;
			EXPECT_EQ(first.endOffset(0), second.endOffset(0)) << pattern << " on " << text;
		}
	}
}
