#include <catch2/catch_test_macros.hpp>

#include "flowgate/graph/value_graph.hpp"

using namespace flowgate;
using namespace flowgate::graph;

TEST_CASE("ValueGraph insertion", "[graph][value_graph]") {
    ValueGraph graph(GraphBudgets{.max_values = 10, .max_parents_per_value = 2});

    REQUIRE(graph.insert(1, labels::Label{}, {}, "input"));
    REQUIRE(graph.insert(2, labels::Label{}, {}, "input"));
    REQUIRE(graph.insert(3, labels::Label{}, {1, 2}, "concat"));

    CHECK(graph.size() == 3);
    CHECK(graph.contains(3));
    CHECK(graph.next_id() == 4);

    auto view = graph.read();
    const auto* node = view.find(3);
    REQUIRE(node != nullptr);
    CHECK(node->parents == std::vector<ValueId>{1, 2});
    CHECK(node->operation == "concat");
    CHECK(view.find(99) == nullptr);
}

TEST_CASE("ValueGraph rejects invalid edges", "[graph][value_graph]") {
    ValueGraph graph(GraphBudgets{.max_values = 10, .max_parents_per_value = 2});
    REQUIRE(graph.insert(5, labels::Label{}, {}));

    SECTION("Unknown parent") {
        auto result = graph.insert(6, labels::Label{}, {4});
        REQUIRE_FALSE(result);
        CHECK(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("Non-increasing ID, which is how a cycle would have to start") {
        auto result = graph.insert(5, labels::Label{}, {});
        REQUIRE_FALSE(result);
        CHECK(result.error().code() == ErrorCode::InvalidArgument);

        auto older = graph.insert(3, labels::Label{}, {5});
        REQUIRE_FALSE(older);
        CHECK(older.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("Repeated parent") {
        auto result = graph.insert(6, labels::Label{}, {5, 5});
        REQUIRE_FALSE(result);
        CHECK(result.error().code() == ErrorCode::InvalidArgument);
    }

    CHECK(graph.size() == 1);
}

TEST_CASE("ValueGraph budgets", "[graph][value_graph]") {
    ValueGraph graph(GraphBudgets{.max_values = 3, .max_parents_per_value = 2});
    REQUIRE(graph.insert(1, labels::Label{}, {}));
    REQUIRE(graph.insert(2, labels::Label{}, {}));
    REQUIRE(graph.insert(3, labels::Label{}, {}));

    SECTION("max_values") {
        auto result = graph.insert(4, labels::Label{}, {});
        REQUIRE_FALSE(result);
        CHECK(result.error().code() == ErrorCode::BudgetExceeded);
    }

    SECTION("max_parents_per_value") {
        ValueGraph narrow(GraphBudgets{.max_values = 10, .max_parents_per_value = 2});
        REQUIRE(narrow.insert(1, labels::Label{}, {}));
        REQUIRE(narrow.insert(2, labels::Label{}, {}));
        REQUIRE(narrow.insert(3, labels::Label{}, {}));
        REQUIRE(narrow.insert(4, labels::Label{}, {1, 2}));

        auto result = narrow.insert(5, labels::Label{}, {1, 2, 3});
        REQUIRE_FALSE(result);
        CHECK(result.error().code() == ErrorCode::BudgetExceeded);
    }
}

TEST_CASE("ValueGraph reset allows ID reuse", "[graph][value_graph]") {
    ValueGraph graph(GraphBudgets{});
    REQUIRE(graph.insert(1, labels::Label{}, {}));
    graph.reset();
    CHECK(graph.size() == 0);
    CHECK(graph.insert(1, labels::Label{}, {}));
}
