#pragma once
#include "cell/CellBase.hpp"
#include "core/Error.hpp"

#include <functional>
#include <memory>
#include <optional>

namespace RFS {

/**
 * Cell<T> - a lazily computed value plus a version counter.
 *
 * read() serves the cached value or runs the compute function on a miss.
 * The compute function runs without the cell lock held; when an invalidation
 * lands while it runs, the result is returned to this caller but not stored,
 * and the read is recorded against the version observed before computing so
 * a tracking stream re-runs.
 *
 * Errors from the compute function are returned and never cached.
 */
template <typename T>
class Cell final : public CellBase {
public:
    using ComputeFn = std::function<Expected<T>()>;

    explicit Cell(ComputeFn compute = {})
        : compute(std::move(compute)) {}

    static auto Create(ComputeFn compute = {}) -> std::shared_ptr<Cell<T>> {
        return std::make_shared<Cell<T>>(std::move(compute));
    }

    static auto CreateWithValue(T initial) -> std::shared_ptr<Cell<T>> {
        auto cell   = std::make_shared<Cell<T>>();
        cell->value = std::move(initial);
        return cell;
    }

    auto read() -> Expected<T> {
        std::unique_lock<std::mutex> lock(this->valueMutex);
        auto const                   observed = this->version();
        if (this->value) {
            T copy = *this->value;
            lock.unlock();
            this->recordRead(observed);
            return copy;
        }
        if (!this->compute) {
            lock.unlock();
            this->recordRead(observed);
            return std::unexpected(Error{Error::Code::NotFound, "Cell has neither a value nor a compute function"});
        }
        lock.unlock();

        auto computed = this->compute();

        lock.lock();
        if (computed && !this->value && this->version() == observed)
            this->value = *computed;
        lock.unlock();

        this->recordRead(observed);
        return computed;
    }

    // Stores a value directly, bypassing the compute function.
    auto set(T newValue) -> void {
        {
            std::lock_guard<std::mutex> lock(this->valueMutex);
            this->value = std::move(newValue);
            this->bumpVersionLocked();
        }
        this->notifyListeners();
    }

    // Cached value without computing or recording a dependency.
    [[nodiscard]] auto peek() const -> std::optional<T> {
        std::lock_guard<std::mutex> lock(this->valueMutex);
        return this->value;
    }

    [[nodiscard]] auto hasValue() const -> bool {
        std::lock_guard<std::mutex> lock(this->valueMutex);
        return this->value.has_value();
    }

private:
    auto discardValueLocked() -> void override { this->value.reset(); }

    ComputeFn        compute;
    std::optional<T> value;
};

} // namespace RFS
