#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <cmath>
#include <iostream>
#include <limits>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include "errors.hpp"
#include "utils.hpp"
#include "vector_store.hpp"

using namespace convmem;

// Keyword-axis embedder: one dimension per keyword plus a constant bias axis.
class KeywordProvider : public EmbeddingProvider {
public:
    std::atomic<int> calls{0};
    std::atomic<bool> return_empty{false};
    std::atomic<bool> fail_with_timeout{false};
    std::shared_future<void> gate;   // texts containing "slow" wait on it

    ProviderTag tag() const override { return {"fake", "keywords", 5}; }

protected:
    std::vector<float> do_embed(const std::string& text, const EmbedOptions&) override {
        calls++;
        if (fail_with_timeout) throw ProviderError(ProviderErrorKind::timeout, "simulated timeout");
        if (return_empty) return {};
        if (text.find("slow") != std::string::npos && gate.valid()) gate.wait();

        static const char* keywords[] = {"alpha", "beta", "gamma", "delta"};
        std::string lower = to_lower(text);
        std::vector<float> v(5, 0.0f);
        for (size_t i = 0; i < 4; i++) {
            size_t pos = 0;
            while ((pos = lower.find(keywords[i], pos)) != std::string::npos) {
                v[i] += 1.0f;
                pos++;
            }
        }
        v[4] = 0.1f;
        return v;
    }
};

static ConversationTurn make_turn(const std::string& question, std::vector<std::string> tables = {}) {
    ConversationTurn t;
    t.question = question;
    for (auto& table : tables) t.metadata.add_table(table);
    return t;
}

static void test_insertion_order_and_recency() {
    std::cout << "[Test] insertion order and recency window..." << std::endl;
    auto provider = std::make_shared<KeywordProvider>();
    VectorStore store("conv", provider);
    assert(store.empty());

    std::vector<std::string> questions = {"alpha one", "beta two", "gamma three", "delta four", "alpha beta five"};
    for (size_t i = 0; i < questions.size(); i++) {
        size_t index = store.add(make_turn(questions[i]));
        assert(index == i);
    }
    assert(store.size() == questions.size());
    assert(store.dimensions() == 5);

    auto all = store.get_recent_turns(questions.size());
    assert(all.size() == questions.size());
    for (size_t i = 0; i < all.size(); i++) {
        assert(all[i].question == questions[i]);
        assert(all[i].id == "turn_" + std::to_string(i + 1));
        assert(!all[i].timestamp.empty());
        assert(all[i].embedding.size() == 5);
    }

    auto last2 = store.get_recent_turns(2);
    assert(last2.size() == 2);
    assert(last2[0].question == "delta four" && last2[1].question == "alpha beta five");
    assert(store.get_recent_turns(100).size() == questions.size());
    assert(store.get_recent_turns(0).empty());
    assert((store.recent_indices(2) == std::set<size_t>{3, 4}));

    auto window = store.recent_window(3);
    assert(window.first_index == 2 && window.total == 5 && window.turns.size() == 3);
    assert(store.get_turn(4) && store.get_turn(4)->question == "alpha beta five");
    assert(!store.get_turn(5));
    std::cout << "[PASS] insertion order and recency window" << std::endl;
}

static void test_search_bound_and_ordering() {
    std::cout << "[Test] search respects k and ranks by similarity..." << std::endl;
    auto provider = std::make_shared<KeywordProvider>();
    VectorStore store("conv", provider);
    std::vector<std::string> questions = {
        "alpha", "beta", "alpha alpha beta", "gamma", "delta delta", "alpha gamma", "beta beta", "nothing"
    };
    for (auto& q : questions) store.add(make_turn(q));

    std::string query = "alpha beta";
    std::vector<float> qv = {1.0f, 1.0f, 0.0f, 0.0f, 0.1f};

    for (size_t k = 0; k <= questions.size() + 1; k++) {
        auto results = store.search(query, k);
        assert(results.size() <= k);
        assert(results.size() == std::min(k, questions.size()));

        std::set<size_t> returned;
        float weakest = 2.0f;
        for (size_t i = 0; i < results.size(); i++) {
            if (i > 0) assert(results[i - 1].similarity >= results[i].similarity);
            assert(results[i].turn.question == questions[results[i].index]);
            returned.insert(results[i].index);
            weakest = std::min(weakest, results[i].similarity);
        }
        for (size_t i = 0; i < questions.size(); i++) {
            if (returned.count(i)) continue;
            float s = cosine(qv, store.get_turn(i)->embedding);
            assert(weakest >= s);
        }
    }

    auto top = store.search(query, 1);
    assert(top.size() == 1 && top[0].index == 2);
    std::cout << "[PASS] search respects k and ranks by similarity" << std::endl;
}

static void test_search_exclusion_and_filter() {
    std::cout << "[Test] search exclusion and metadata filter..." << std::endl;
    auto provider = std::make_shared<KeywordProvider>();
    VectorStore store("conv", provider);
    store.add(make_turn("alpha", {"orders"}));
    store.add(make_turn("alpha alpha", {"customers"}));
    store.add(make_turn("beta", {"orders"}));

    auto best = store.search("alpha", 3);
    assert(best.size() == 3);

    auto excluded = store.search("alpha", 3, {best[0].index});
    assert(excluded.size() == 2);
    for (auto& r : excluded) assert(r.index != best[0].index);

    MetadataFilter orders;
    orders.tables = std::set<std::string>{"orders"};
    auto filtered = store.search("alpha", 3, {}, orders);
    assert(filtered.size() == 2);
    assert(filtered[0].index == 0 && filtered[1].index == 2);

    auto both = store.search("alpha", 3, {0}, orders);
    assert(both.size() == 1 && both[0].index == 2);

    std::set<size_t> everything = {0, 1, 2};
    assert(store.search("alpha", 3, everything).empty());
    std::cout << "[PASS] search exclusion and metadata filter" << std::endl;
}

static void test_empty_inputs_skip_provider() {
    std::cout << "[Test] empty store, k=0 and blank query skip the provider..." << std::endl;
    auto provider = std::make_shared<KeywordProvider>();
    VectorStore store("conv", provider);
    assert(store.search("alpha", 3).empty());
    assert(provider->calls == 0);

    store.add(make_turn("alpha"));
    int after_add = provider->calls;
    assert(store.search("alpha", 0).empty());
    assert(store.search("", 3).empty());
    assert(store.search("   \n", 3).empty());
    assert(provider->calls == after_add);
    std::cout << "[PASS] empty store, k=0 and blank query skip the provider" << std::endl;
}

static void test_clear() {
    std::cout << "[Test] clear empties the store..." << std::endl;
    auto provider = std::make_shared<KeywordProvider>();
    VectorStore store("conv", provider);
    store.add(make_turn("alpha"));
    store.add(make_turn("beta"));
    store.clear();

    assert(store.size() == 0);
    assert(store.dimensions() == 0);
    assert(store.search("alpha", 3).empty());
    assert(store.get_recent_turns(5).empty());

    // Ids and indices start over.
    assert(store.add(make_turn("gamma")) == 0);
    assert(store.get_turn(0)->id == "turn_1");
    std::cout << "[PASS] clear empties the store" << std::endl;
}

static void test_supplier_scenario() {
    std::cout << "[Test] supplier/warehouse scenario..." << std::endl;
    VectorStore store("suppliers", std::make_shared<HashingEmbeddingProvider>());
    store.add(make_turn("How many suppliers do we have?", {"suppliers"}));
    store.add(make_turn("Show me the top 5 most reliable suppliers", {"suppliers"}));
    store.add(make_turn("List all warehouse locations", {"warehouses"}));

    MetadataFilter filter;
    filter.tables = std::set<std::string>{"suppliers"};
    auto results = store.search("Which suppliers are most reliable?", 2, {}, filter);

    assert(results.size() == 2);
    std::set<size_t> indices = {results[0].index, results[1].index};
    assert((indices == std::set<size_t>{0, 1}));
    float s0 = results[0].index == 0 ? results[0].similarity : results[1].similarity;
    float s1 = results[0].index == 1 ? results[0].similarity : results[1].similarity;
    assert(s1 >= s0);
    std::cout << "[PASS] supplier/warehouse scenario" << std::endl;
}

static void test_provider_failures_leave_store_unchanged() {
    std::cout << "[Test] provider failures leave the store unchanged..." << std::endl;
    auto provider = std::make_shared<KeywordProvider>();
    VectorStore store("conv", provider);
    store.add(make_turn("alpha"));

    provider->return_empty = true;
    bool thrown = false;
    try {
        store.add(make_turn("beta"));
    } catch (const ProviderError& e) {
        thrown = true;
        assert(e.kind() == ProviderErrorKind::empty_embedding);
    }
    assert(thrown);
    assert(store.size() == 1);
    provider->return_empty = false;

    provider->fail_with_timeout = true;
    thrown = false;
    try {
        store.add(make_turn("beta"));
    } catch (const ProviderError& e) {
        thrown = true;
        assert(e.kind() == ProviderErrorKind::timeout);
    }
    assert(thrown);
    assert(store.size() == 1);

    thrown = false;
    try {
        store.search("alpha", 3);
    } catch (const ProviderError&) {
        thrown = true;
    }
    assert(thrown);
    provider->fail_with_timeout = false;

    // The failed attempts did not consume an index.
    assert(store.add(make_turn("beta")) == 1);
    assert(store.get_turn(1)->id == "turn_2");
    std::cout << "[PASS] provider failures leave the store unchanged" << std::endl;
}

static void test_cancellation() {
    std::cout << "[Test] cancellation..." << std::endl;
    auto provider = std::make_shared<KeywordProvider>();
    VectorStore store("conv", provider);
    store.add(make_turn("alpha"));
    int calls = provider->calls;

    std::atomic<bool> cancel{true};
    EmbedOptions opts;
    opts.cancel = &cancel;

    bool thrown = false;
    try {
        store.add(make_turn("beta"), opts);
    } catch (const ProviderError& e) {
        thrown = true;
        assert(e.kind() == ProviderErrorKind::cancelled);
    }
    assert(thrown);
    assert(store.size() == 1);
    assert(provider->calls == calls);

    thrown = false;
    try {
        store.search("alpha", 3, {}, {}, opts);
    } catch (const ProviderError& e) {
        thrown = true;
        assert(e.kind() == ProviderErrorKind::cancelled);
    }
    assert(thrown);

    cancel = false;
    assert(store.search("alpha", 3, {}, {}, opts).size() == 1);
    std::cout << "[PASS] cancellation" << std::endl;
}

static void test_duplicate_and_dimension_checks() {
    std::cout << "[Test] duplicate ids and dimension mismatches..." << std::endl;
    auto provider = std::make_shared<KeywordProvider>();
    VectorStore store("conv", provider);

    ConversationTurn first = make_turn("alpha");
    first.id = "q1";
    store.add(first);

    bool thrown = false;
    try {
        store.add(first);
    } catch (const DuplicateTurn& e) {
        thrown = true;
        assert(e.turn_id() == "q1");
    }
    assert(thrown);
    assert(store.size() == 1);

    ConversationTurn wrong = make_turn("beta");
    wrong.embedding = {1.0f, 2.0f, 3.0f};
    thrown = false;
    try {
        store.add(wrong);
    } catch (const DimensionMismatch& e) {
        thrown = true;
        assert(e.expected() == 5 && e.actual() == 3);
    }
    assert(thrown);
    assert(store.size() == 1);

    // A supplied embedding of the right size is stored as-is.
    int calls = provider->calls;
    ConversationTurn supplied = make_turn("gamma");
    supplied.embedding = {0.0f, 0.0f, 1.0f, 0.0f, 0.1f};
    assert(store.add(supplied) == 1);
    assert(provider->calls == calls);
    assert(store.get_turn(1)->embedding == supplied.embedding);

    // Even the first turn must fit the provider's space.
    VectorStore fresh("other", provider);
    thrown = false;
    try {
        fresh.add(wrong);
    } catch (const DimensionMismatch&) {
        thrown = true;
    }
    assert(thrown);
    assert(fresh.empty());
    std::cout << "[PASS] duplicate ids and dimension mismatches" << std::endl;
}

static void test_non_finite_embeddings_rejected() {
    std::cout << "[Test] non-finite supplied embeddings are rejected..." << std::endl;
    auto provider = std::make_shared<KeywordProvider>();
    VectorStore store("conv", provider);

    // Out-of-range JSON numbers never reach the store as inf.
    bool thrown = false;
    try {
        ConversationTurn::from_json(nlohmann::json::parse(
            R"({"question":"x","embedding":[1e39,0,0,0,0]})"));
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    std::vector<std::vector<float>> bad = {
        {std::numeric_limits<float>::infinity(), 0.0f, 0.0f, 0.0f, 0.0f},
        {0.0f, std::numeric_limits<float>::quiet_NaN(), 0.0f, 0.0f, 0.0f}
    };
    for (auto& v : bad) {
        ConversationTurn t = make_turn("x");
        t.embedding = v;
        thrown = false;
        try {
            store.add(t);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
        assert(store.empty());
    }

    store.add(make_turn("alpha"));
    store.add(make_turn("beta"));
    auto results = store.search("alpha", 2);
    assert(results.size() == 2);
    assert(results[0].index == 0);
    for (auto& r : results) assert(std::isfinite(r.similarity));
    std::cout << "[PASS] non-finite supplied embeddings are rejected" << std::endl;
}

static void test_generated_ids_skip_taken_ids() {
    std::cout << "[Test] generated ids skip ids already in use..." << std::endl;
    auto provider = std::make_shared<KeywordProvider>();
    VectorStore store("conv", provider);

    ConversationTurn named = make_turn("alpha");
    named.id = "turn_2";
    assert(store.add(named) == 0);

    assert(store.add(make_turn("beta")) == 1);
    assert(store.get_turn(1)->id == "turn_3");

    assert(store.add(make_turn("gamma")) == 2);
    assert(store.get_turn(2)->id == "turn_4");
    assert(store.size() == 3);
    std::cout << "[PASS] generated ids skip ids already in use" << std::endl;
}

static void test_concurrent_adds() {
    std::cout << "[Test] concurrent adds get distinct sequential indices..." << std::endl;
    auto provider = std::make_shared<KeywordProvider>();
    VectorStore store("conv", provider);

    const int NUM_THREADS = 32;
    std::vector<std::thread> threads;
    std::mutex indices_mutex;
    std::set<size_t> indices;

    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&, i]() {
            size_t index = store.add(make_turn("alpha message " + std::to_string(i)));
            std::lock_guard<std::mutex> lock(indices_mutex);
            indices.insert(index);
        });
    }
    for (auto& t : threads) t.join();

    assert(store.size() == static_cast<size_t>(NUM_THREADS));
    assert(indices.size() == static_cast<size_t>(NUM_THREADS));
    assert(*indices.begin() == 0);
    assert(*indices.rbegin() == static_cast<size_t>(NUM_THREADS - 1));

    std::set<std::string> ids;
    for (auto& t : store.get_recent_turns(NUM_THREADS)) ids.insert(t.id);
    assert(ids.size() == static_cast<size_t>(NUM_THREADS));
    std::cout << "[PASS] concurrent adds get distinct sequential indices" << std::endl;
}

static void test_search_during_inflight_add() {
    std::cout << "[Test] search runs while an add waits on the provider..." << std::endl;
    auto provider = std::make_shared<KeywordProvider>();
    std::promise<void> release;
    provider->gate = release.get_future().share();

    VectorStore store("conv", provider);
    store.add(make_turn("alpha"));

    auto pending = std::async(std::launch::async, [&]() {
        return store.add(make_turn("slow alpha"));
    });

    // Wait until the slow embedding call has started.
    while (provider->calls < 2) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    auto results = store.search("alpha", 3);
    assert(results.size() == 1);
    assert(store.size() == 1);

    release.set_value();
    assert(pending.get() == 1);
    assert(store.size() == 2);
    assert(store.search("alpha", 3).size() == 2);
    std::cout << "[PASS] search runs while an add waits on the provider" << std::endl;
}

int main() {
    test_insertion_order_and_recency();
    test_search_bound_and_ordering();
    test_search_exclusion_and_filter();
    test_empty_inputs_skip_provider();
    test_clear();
    test_supplier_scenario();
    test_provider_failures_leave_store_unchanged();
    test_cancellation();
    test_duplicate_and_dimension_checks();
    test_non_finite_embeddings_rejected();
    test_generated_ids_skip_taken_ids();
    test_concurrent_adds();
    test_search_during_inflight_add();
    std::cout << "[Test] All vector store tests passed." << std::endl;
    return 0;
}
