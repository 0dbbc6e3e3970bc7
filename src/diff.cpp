#include <jsonrev-cpp/diff.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace jsonrev_cpp {

namespace {

class DiffBuilder {
public:
    auto run(const Value& before, const Value& after) -> EditScript {
        diff_value(before, after);
        return std::move(edits_);
    }

private:
    void diff_value(const Value& before, const Value& after) {
        if (before.kind() != after.kind()) {
            edits_.push_back(EditOp::replace(path_, after));
            return;
        }

        std::visit([&](const auto& old_arg) {
            using T = std::decay_t<decltype(old_arg)>;

            if constexpr (std::is_same_v<T, Object>) {
                diff_object(old_arg, *after.get_if<Object>());
            } else if constexpr (std::is_same_v<T, Array>) {
                diff_array(old_arg, *after.get_if<Array>());
            } else if constexpr (std::is_same_v<T, Null>) {
                // null never changes into null
            } else {
                if (old_arg != *after.get_if<T>()) {
                    edits_.push_back(EditOp::replace(path_, after));
                }
            }
        }, before.data());
    }

    void diff_object(const Object& before, const Object& after) {
        for (const auto& m : before) {
            if (!after.contains(m.key)) {
                path_.emplace_back(m.key);
                edits_.push_back(EditOp::remove(path_));
                path_.pop_back();
            }
        }
        for (const auto& m : before) {
            if (const auto* next = after.find(m.key)) {
                path_.emplace_back(m.key);
                diff_value(m.value, *next);
                path_.pop_back();
            }
        }
        for (const auto& m : after) {
            if (!before.contains(m.key)) {
                path_.emplace_back(m.key);
                edits_.push_back(EditOp::add(path_, m.value));
                path_.pop_back();
            }
        }
    }

    void diff_array(const Array& before, const Array& after) {
        const auto common = std::min(before.size(), after.size());
        for (std::size_t i = 0; i < common; ++i) {
            path_.emplace_back(i);
            diff_value(before[i], after[i]);
            path_.pop_back();
        }
        // Highest index first so earlier removals do not shift later paths.
        for (auto i = before.size(); i > common; --i) {
            path_.emplace_back(i - 1);
            edits_.push_back(EditOp::remove(path_));
            path_.pop_back();
        }
        for (auto i = common; i < after.size(); ++i) {
            path_.emplace_back(i);
            edits_.push_back(EditOp::add(path_, after[i]));
            path_.pop_back();
        }
    }

    Path path_;
    EditScript edits_;
};

}  // anonymous namespace

auto diff(const Value& before, const Value& after) -> EditScript {
    return DiffBuilder{}.run(before, after);
}

}  // namespace jsonrev_cpp
