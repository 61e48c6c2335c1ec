#include "processing/diff.hpp"

#include "output/printer.hpp"

#include <doctest.h>

#include <algorithm>

using namespace yamlview;

namespace {

std::vector<std::string>
view_texts(const DiffView& view) {
    return view.source->texts();
}

std::vector<LineFlag>
view_flags(const DiffView& view) {
    std::vector<LineFlag> flags;
    for (const auto& line : view.source->lines()) {
        flags.push_back(line.flag);
    }
    return flags;
}

int64_t
count_ops(const std::vector<DiffEvent>& events, DiffOp op) {
    return std::count_if(events.begin(), events.end(), [op](const DiffEvent& e) { return e.op == op; });
}

const std::vector<DiffAlgorithm> kAlgorithms = {DiffAlgorithm::MyersGreedy, DiffAlgorithm::MyersLinear};

}  // namespace

TEST_CASE("diff lines: replacement deletes first") {
    for (auto algorithm : kAlgorithms) {
        CAPTURE(diff_algorithm_name(algorithm));
        auto events = diff_lines({"a", "b", "c"}, {"a", "B", "c"}, algorithm);
        REQUIRE(events == std::vector<DiffEvent>{{DiffOp::Equal, 1, 1},
                                                 {DiffOp::Delete, 2, 0},
                                                 {DiffOp::Insert, 0, 2},
                                                 {DiffOp::Equal, 3, 3}});
    }
}

TEST_CASE("diff lines: identity") {
    std::vector<std::string> lines = {"x: 1", "y: 2", "", "z: 3"};
    for (auto algorithm : kAlgorithms) {
        CAPTURE(diff_algorithm_name(algorithm));
        auto events = diff_lines(lines, lines, algorithm);
        REQUIRE(events.size() == lines.size());
        REQUIRE(count_ops(events, DiffOp::Equal) == 4);
    }
}

TEST_CASE("diff lines: empty sides") {
    for (auto algorithm : kAlgorithms) {
        CAPTURE(diff_algorithm_name(algorithm));
        REQUIRE(diff_lines({}, {}, algorithm).empty());

        auto inserted = diff_lines({}, {"a", "b"}, algorithm);
        REQUIRE(inserted == std::vector<DiffEvent>{{DiffOp::Insert, 0, 1}, {DiffOp::Insert, 0, 2}});

        auto deleted = diff_lines({"a", "b"}, {}, algorithm);
        REQUIRE(deleted == std::vector<DiffEvent>{{DiffOp::Delete, 1, 0}, {DiffOp::Delete, 2, 0}});
    }
}

TEST_CASE("diff lines: minimal script") {
    std::vector<std::string> a = {"a", "b", "c", "a", "b", "b", "a"};
    std::vector<std::string> b = {"c", "b", "a", "b", "a", "c"};

    for (auto algorithm : kAlgorithms) {
        CAPTURE(diff_algorithm_name(algorithm));
        auto events = diff_lines(a, b, algorithm);
        REQUIRE(count_ops(events, DiffOp::Delete) + count_ops(events, DiffOp::Insert) == 5);
        REQUIRE(count_ops(events, DiffOp::Equal) == 4);

        // The script replays A into B.
        std::vector<std::string> replay;
        int64_t a_seen = 0;
        for (const auto& e : events) {
            if (e.op != DiffOp::Insert) {
                REQUIRE(e.a_line == ++a_seen);
            }
            if (e.op == DiffOp::Equal) {
                REQUIRE(a[e.a_line - 1] == b[e.b_line - 1]);
            }
            if (e.op != DiffOp::Delete) {
                replay.push_back(b[e.b_line - 1]);
            }
        }
        REQUIRE(replay == b);
        REQUIRE(a_seen == static_cast<int64_t>(a.size()));
    }
}

TEST_CASE("diff lines: symmetry") {
    std::vector<std::string> a = {"name: app", "replicas: 1", "image: nginx", "ports:", "  - 80"};
    std::vector<std::string> b = {"name: app", "replicas: 3", "image: nginx", "ports:", "  - 80", "  - 443"};

    for (auto algorithm : kAlgorithms) {
        CAPTURE(diff_algorithm_name(algorithm));
        auto forward = diff_lines(a, b, algorithm);
        auto backward = diff_lines(b, a, algorithm);
        REQUIRE(count_ops(forward, DiffOp::Delete) == count_ops(backward, DiffOp::Insert));
        REQUIRE(count_ops(forward, DiffOp::Insert) == count_ops(backward, DiffOp::Delete));

        std::vector<std::pair<int64_t, int64_t>> forward_equal;
        std::vector<std::pair<int64_t, int64_t>> backward_equal;
        for (const auto& e : forward) {
            if (e.op == DiffOp::Equal) {
                forward_equal.emplace_back(e.a_line, e.b_line);
            }
        }
        for (const auto& e : backward) {
            if (e.op == DiffOp::Equal) {
                backward_equal.emplace_back(e.b_line, e.a_line);
            }
        }
        REQUIRE(forward_equal == backward_equal);
    }
}

TEST_CASE("diff lines: symmetry with several common subsequences") {
    const std::vector<std::pair<std::vector<std::string>, std::vector<std::string>>> cases = {
        {{"a", "b"}, {"b", "a"}},
        {{"a", "b", "a"}, {"b", "a", "b"}},
        {{"x: 1", "y: 2", "x: 1"}, {"y: 2", "x: 1", "y: 2", "x: 1"}},
        {{"- a", "- b", "- c"}, {"- c", "- b", "- a"}},
    };

    for (auto algorithm : kAlgorithms) {
        CAPTURE(diff_algorithm_name(algorithm));
        for (const auto& [a, b] : cases) {
            auto forward = diff_lines(a, b, algorithm);
            auto backward = diff_lines(b, a, algorithm);

            std::vector<std::pair<int64_t, int64_t>> forward_equal;
            std::vector<std::pair<int64_t, int64_t>> backward_equal;
            for (const auto& e : forward) {
                if (e.op == DiffOp::Equal) {
                    forward_equal.emplace_back(e.a_line, e.b_line);
                }
            }
            for (const auto& e : backward) {
                if (e.op == DiffOp::Equal) {
                    backward_equal.emplace_back(e.b_line, e.a_line);
                }
            }
            REQUIRE_FALSE(forward_equal.empty());
            REQUIRE(forward_equal == backward_equal);
            REQUIRE(count_ops(forward, DiffOp::Delete) == count_ops(backward, DiffOp::Insert));
            REQUIRE(count_ops(forward, DiffOp::Insert) == count_ops(backward, DiffOp::Delete));
        }
    }

    SUBCASE("swapped lines keep the same line") {
        auto forward = diff_lines({"a", "b"}, {"b", "a"});
        auto backward = diff_lines({"b", "a"}, {"a", "b"});
        REQUIRE(forward.size() == 3);
        REQUIRE(backward.size() == 3);
        REQUIRE(forward[0].op == DiffOp::Delete);
        REQUIRE(forward[2].op == DiffOp::Insert);
        REQUIRE(backward[0].op == DiffOp::Insert);
        REQUIRE(backward[2].op == DiffOp::Delete);

        const auto& kept = forward[1];
        REQUIRE(kept.op == DiffOp::Equal);
        REQUIRE(backward[1].op == DiffOp::Equal);
        REQUIRE(backward[1].a_line == kept.b_line);
        REQUIRE(backward[1].b_line == kept.a_line);
    }
}

TEST_CASE("diff lines: algorithm names") {
    REQUIRE(diff_algorithm_from_name("myers-greedy") == DiffAlgorithm::MyersGreedy);
    REQUIRE(diff_algorithm_from_name("myers-linear") == DiffAlgorithm::MyersLinear);
    REQUIRE_FALSE(diff_algorithm_from_name("patience").has_value());
    REQUIRE(std::string(diff_algorithm_name(DiffAlgorithm::MyersLinear)) == "myers-linear");
}

TEST_CASE("diff hunks") {
    auto edits = [](const std::string& pattern) {
        // 'c' common, 'd' delete, 'i' insert
        EditScript script;
        int64_t a = 0;
        int64_t b = 0;
        for (char c : pattern) {
            if (c == 'c') {
                script.push_back({EditType::Common, a++, b++});
            } else if (c == 'd') {
                script.push_back({EditType::Delete, a++, {}});
            } else {
                script.push_back({EditType::Insert, {}, b++});
            }
        }
        return script;
    };

    SUBCASE("no changes") {
        REQUIRE(compose_hunks(edits("cccc"), 3).empty());
        REQUIRE(compose_hunks({}, 3).empty());
    }

    SUBCASE("context") {
        auto hunks = compose_hunks(edits("cccccdicccccc"), 1);
        REQUIRE(hunks.size() == 1);
        REQUIRE(hunks[0].first_edit == 4);
        REQUIRE(hunks[0].last_edit == 7);
        REQUIRE(hunk_header(hunks[0]) == "@@ -5,3 +5,3 @@");
    }

    SUBCASE("joined when context touches") {
        REQUIRE(compose_hunks(edits("cdccci"), 1).size() == 2);
        REQUIRE(compose_hunks(edits("cdcci"), 1).size() == 1);
        REQUIRE(compose_hunks(edits("cdci"), 0).size() == 2);
    }

    SUBCASE("pure insertion") {
        auto hunks = compose_hunks(edits("ccii"), 0);
        REQUIRE(hunks.size() == 1);
        REQUIRE(hunk_header(hunks[0]) == "@@ -2,0 +3,2 @@");
    }
}

TEST_CASE("diff views") {
    auto origin = Source::from_string("a\nb\nc\n", {std::string("old.yaml")});
    auto tip = Source::from_string("a\nB\nc\n", {std::string("new.yaml")});

    SUBCASE("full diff") {
        auto view = full_diff(*origin, *tip);
        REQUIRE(view_texts(view) == std::vector<std::string>{"a", "b", "B", "c"});
        REQUIRE(view_flags(view)
                == std::vector<LineFlag>{LineFlag::Default, LineFlag::Deleted, LineFlag::Inserted, LineFlag::Default});
        REQUIRE(view.highlight_ranges.empty());

        const auto& overlays = view.source->overlays();
        REQUIRE(overlays.size() == 2);
        REQUIRE(overlays[0].category == Category::GenericDeleted);
        REQUIRE(overlays[0].span == Span::line(2));
        REQUIRE(overlays[1].category == Category::GenericInserted);
        REQUIRE(overlays[1].span == Span::line(3));

        REQUIRE(view.source->name() == std::optional<std::string>("old.yaml → new.yaml"));
        REQUIRE(view.source->has_trailing_newline());
    }

    SUBCASE("display numbers") {
        auto view = full_diff(*Source::from_lines({"x", "y", "z"}), *Source::from_lines({"w", "x", "z"}));
        std::vector<int64_t> numbers;
        for (const auto& line : view.source->lines()) {
            numbers.push_back(line.number);
        }
        // w(+1) x(2) y(-2) z(3)
        REQUIRE(view_texts(view) == std::vector<std::string>{"w", "x", "y", "z"});
        REQUIRE(numbers == std::vector<int64_t>{1, 2, 2, 3});
    }

    SUBCASE("summary diff") {
        auto view = summary_diff(*origin, *tip, 1);
        REQUIRE(view_texts(view) == std::vector<std::string>{"a", "b", "B", "c"});
        REQUIRE(view.highlight_ranges == std::vector<Span>{Span::lines(2, 3)});
        REQUIRE(view.hunks.size() == 1);
        REQUIRE(view.source->line_at(1).hunk_start);

        auto tight = summary_diff(*origin, *tip, 0);
        REQUIRE(view_texts(tight) == std::vector<std::string>{"b", "B"});
        REQUIRE(tight.highlight_ranges == std::vector<Span>{Span::lines(1, 2)});
    }

    SUBCASE("summary hunks") {
        std::vector<std::string> a;
        for (int i = 1; i <= 20; i++) {
            a.push_back("key" + std::to_string(i) + ": " + std::to_string(i));
        }
        auto b = a;
        b[2] = "key3: changed";
        b[16] = "key17: changed";

        DiffOptions options;
        options.hunk_headers = true;
        auto view = summary_diff(*Source::from_lines(a), *Source::from_lines(b), 2, options);
        REQUIRE(view.hunks.size() == 2);
        REQUIRE(view.highlight_ranges.size() == 2);
        REQUIRE(view.source->line_count() == 12);
        REQUIRE(view.source->line_at(1).hunk_start);
        REQUIRE(view.source->line_at(7).hunk_start);
        REQUIRE(view.source->line_at(1).annotations[0].content == "@@ -1,5 +1,5 @@");
        REQUIRE(view.source->line_at(7).annotations[0].content == "@@ -15,5 +15,5 @@");

        auto printer_options = PrinterOptions();
        printer_options.color_profile = ColorProfile::None;
        printer_options.annotations = false;
        auto out = Printer(printer_options).print(*view.source);
        REQUIRE(out.find("key5: 5\n\nkey15: 15") != std::string::npos);
    }

    SUBCASE("identical sources") {
        auto full = full_diff(*origin, *origin);
        REQUIRE(view_texts(full) == std::vector<std::string>{"a", "b", "c"});
        REQUIRE(full.source->overlays().empty());

        for (int64_t k : {0, 1, 5}) {
            auto summary = summary_diff(*origin, *origin, k);
            REQUIRE(summary.highlight_ranges.empty());
            REQUIRE(summary.hunks.empty());
            REQUIRE(summary.source->line_count() == 0);
        }
    }

    SUBCASE("empty sides") {
        auto empty = Source::from_string("");
        auto added = full_diff(*empty, *tip);
        REQUIRE(view_flags(added) == std::vector<LineFlag>(3, LineFlag::Inserted));

        auto removed = full_diff(*origin, *empty);
        REQUIRE(view_flags(removed) == std::vector<LineFlag>(3, LineFlag::Deleted));
    }

    SUBCASE("unnamed side") {
        auto view = full_diff(*origin, *Source::from_string("a\n"));
        REQUIRE_FALSE(view.source->name().has_value());
    }

    SUBCASE("classification is kept") {
        auto a = Source::from_string("key: 1\nother: x\n");
        auto b = Source::from_string("key: 2\nother: x\n");
        a->classify();
        b->classify();

        auto view = full_diff(*a, *b);
        REQUIRE(view.source->line_count() == 3);
        for (int64_t n = 1; n <= 3; n++) {
            const auto& segments = view.source->segments(n);
            REQUIRE_FALSE(segments.empty());
            REQUIRE(segments[0].category == Category::NameTag);
            REQUIRE(segments[0].span.start().line == n);
        }
    }

    SUBCASE("revisions") {
        auto first = Revision::create(origin);
        auto second = first->append(tip);
        auto view = full_diff(*first, *second);
        REQUIRE(view_texts(view) == std::vector<std::string>{"a", "b", "B", "c"});

        auto summary = summary_diff(*first, *second, 1);
        REQUIRE(summary.highlight_ranges == std::vector<Span>{Span::lines(2, 3)});
    }
}
