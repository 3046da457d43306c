#pragma once

#include <stdexcept>
#include <string>

namespace vellum::engine {

    /**
     * @brief Base class of every error raised by the indexing engine.
     */
    class Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief The embedding model failed to load or to produce a vector.
     */
    class ModelFailure : public Error {
    public:
        using Error::Error;
    };

    class EmptyInputError : public Error {
    public:
        EmptyInputError() : Error("input text is empty") {}
    };

    class EmptyQueryError : public Error {
    public:
        EmptyQueryError() : Error("query text is empty") {}
    };

    class IndexNotTrainedError : public Error {
    public:
        IndexNotTrainedError() : Error("index must be trained before vectors are added") {}
    };

    class InsufficientTrainingDataError : public Error {
    public:
        InsufficientTrainingDataError(size_t samples, size_t clusters)
            : Error("training needs at least " + std::to_string(clusters) + " vectors, got " + std::to_string(samples)),
              m_samples(samples), m_clusters(clusters) {}

        size_t samples() const { return m_samples; }
        size_t clusters() const { return m_clusters; }

    private:
        size_t m_samples;
        size_t m_clusters;
    };

    class DimensionMismatchError : public Error {
    public:
        DimensionMismatchError(size_t expected, size_t actual)
            : Error("dimension mismatch: expected " + std::to_string(expected) + ", got " + std::to_string(actual)) {}
    };

    class DocumentNotFoundError : public Error {
    public:
        explicit DocumentNotFoundError(const std::string& key)
            : Error("document not found: " + key), m_key(key) {}

        const std::string& key() const { return m_key; }

    private:
        std::string m_key;
    };

    class NoTextError : public Error {
    public:
        explicit NoTextError(const std::string& key)
            : Error("document has no text: " + key), m_key(key) {}

        const std::string& key() const { return m_key; }

    private:
        std::string m_key;
    };

    /**
     * @brief A snapshot could not be written, read or validated.
     */
    class PersistenceError : public Error {
    public:
        using Error::Error;
    };

}
