#pragma once
#include "config.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace convmem {

// Identifies an embedding space. Vectors from different tags are never compared.
struct ProviderTag {
    std::string provider;
    std::string model;
    size_t dimensions = 0;   // 0 = not known yet

    std::string str() const {
        return provider + "/" + model + "@" + std::to_string(dimensions);
    }
};

struct EmbedOptions {
    std::chrono::milliseconds timeout{0};       // 0 = provider default
    const std::atomic<bool>* cancel = nullptr;  // caller-owned

    bool cancelled() const { return cancel && cancel->load(); }
};

/**
 * Text -> fixed-length vector. One outbound call per embed(), no retry.
 *
 * embed() wraps the implementation with the checks every provider shares:
 * cancellation before and after the call, and rejection of empty, non-finite
 * or wrongly sized vectors. All failures surface as ProviderError.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    std::vector<float> embed(const std::string& text, const EmbedOptions& opts = {});

    virtual ProviderTag tag() const = 0;

protected:
    virtual std::vector<float> do_embed(const std::string& text, const EmbedOptions& opts) = 0;

    // Called with the first accepted vector length when the tag had none.
    virtual void learn_dimensions(size_t) {}
};

// OpenAI-compatible POST {api_base}/embeddings.
class OpenAiEmbeddingProvider : public EmbeddingProvider {
public:
    OpenAiEmbeddingProvider(std::string name, const ProviderConfig& provider,
                            const EmbeddingConfig& embedding);

    ProviderTag tag() const override;

protected:
    std::vector<float> do_embed(const std::string& text, const EmbedOptions& opts) override;
    void learn_dimensions(size_t dims) override;

private:
    std::string name_;
    ProviderConfig provider_;
    EmbeddingConfig embedding_;
    std::string base_url_;      // scheme://host:port
    std::string path_prefix_;   // e.g. /v1
    std::atomic<size_t> dimensions_{0};
};

// Offline bag-of-words hashing embedder (FNV-1a buckets, L2-normalised).
class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(size_t buckets = 4096);

    ProviderTag tag() const override;

protected:
    std::vector<float> do_embed(const std::string& text, const EmbedOptions& opts) override;

private:
    size_t buckets_;
};

// Picks the provider named by cfg.embedding.provider ("local" or a providers key).
std::shared_ptr<EmbeddingProvider> make_embedding_provider(const Config& cfg);

} // namespace convmem
