#pragma once
/**
 * @file sink.hpp
 * @brief The event shape handed to log sinks, and the abstract sink interface.
 *
 * An `Event` is only valid for the duration of the `LogSink::log()` call that
 * receives it: its message, target and structured fields all borrow from the
 * caller. Sinks that keep anything must copy it.
 */
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "logtest_platform.hpp"
#include "utils/log_level.hpp"

namespace logtest::utils
{

/**
 * @class Value
 * @brief Owning, type-erased copy of one structured field value.
 *
 * Text (`const char *`, `std::string`, `std::string_view`) renders with debug
 * quoting and escaping, so `blue` becomes `"blue"`. A `char` renders as `'c'`,
 * a `bool` as `true`/`false`, and any other `fmt`-formattable type through `{}`.
 * Pointers other than C strings are rejected at compile time.
 *
 * The value is copied on construction; rendering is deferred until a sink asks
 * for it and may throw whatever the value's `fmt::formatter` throws. Copies of
 * a Value share the captured object, which is never modified.
 */
class Value
{
  public:
    Value(const char *text) : Value(std::string(text ? text : "")) {}
    Value(std::string_view text) : Value(std::string(text)) {}
    Value(std::string text) noexcept : kind_(Kind::Text), text_(std::move(text)) {}
    Value(char c) noexcept : kind_(Kind::Char), char_(c) {}
    Value(bool b) noexcept : kind_(Kind::Bool), bool_(b) {}

    template <typename T>
        requires(!std::is_convertible_v<const T &, std::string_view> && !std::is_pointer_v<T> &&
                 !std::is_array_v<T> && fmt::is_formattable<T>::value)
    Value(const T &object)
        : kind_(Kind::Object), object_(std::make_shared<ObjectHolder<T>>(object))
    {
    }

    // Would otherwise decay to `bool`.
    template <typename T>
        requires(!std::is_same_v<std::remove_cv_t<T>, char>)
    Value(T *) = delete;

    /// Appends the textual rendering of the value to `out`.
    LOGTEST_EXPORT void render_to(fmt::memory_buffer &out) const;

    /// The textual rendering of the value.
    LOGTEST_EXPORT std::string to_string() const;

  private:
    enum class Kind
    {
        Text,
        Char,
        Bool,
        Object
    };

    struct Holder
    {
        virtual ~Holder() = default;
        virtual void render_to(fmt::memory_buffer &out) const = 0;
    };

    template <typename T> struct ObjectHolder final : Holder
    {
        explicit ObjectHolder(const T &v) : value(v) {}
        void render_to(fmt::memory_buffer &out) const override
        {
            fmt::format_to(std::back_inserter(out), "{}", value);
        }
        T value;
    };

    Kind kind_;
    std::string text_{};
    char char_{};
    bool bool_{};
    std::shared_ptr<const Holder> object_{};
};

/// One structured field attached to a log call.
struct KeyValue
{
    std::string key;
    Value value;
};

/**
 * @class KeyValues
 * @brief The finite sequence of structured fields attached to one log call.
 *
 * Iterating it does not consume it; a sink may walk it as often as it likes
 * while handling the event. It owns its keys and values, so it can be built
 * once, kept in a variable and passed to several logging calls.
 */
class KeyValues
{
  public:
    using const_iterator = std::vector<KeyValue>::const_iterator;

    KeyValues() = default;
    KeyValues(std::initializer_list<KeyValue> pairs) : pairs_(pairs) {}

    const_iterator begin() const noexcept { return pairs_.begin(); }
    const_iterator end() const noexcept { return pairs_.end(); }
    std::size_t size() const noexcept { return pairs_.size(); }
    bool empty() const noexcept { return pairs_.empty(); }

  private:
    std::vector<KeyValue> pairs_;
};

/**
 * @brief Builds the field list for the `*_KV` logging macros.
 *
 * ```cpp
 * LOGTEST_INFO_KV(logtest::fields({{"color", "blue"}, {"count", 3}}), "hello");
 * ```
 */
inline KeyValues fields(std::initializer_list<KeyValue> pairs)
{
    return KeyValues(pairs);
}

/// What a sink needs to decide whether it wants an event.
struct Metadata
{
    Level level;
    std::string_view target;
};

/**
 * @class Event
 * @brief A single log call as seen by a sink.
 */
class Event
{
  public:
    Event(const Metadata &metadata, std::string_view args, const KeyValues &key_values) noexcept
        : metadata_(metadata), args_(args), key_values_(key_values)
    {
    }

    /// The rendered message body.
    std::string_view args() const noexcept { return args_; }
    const Metadata &metadata() const noexcept { return metadata_; }
    Level level() const noexcept { return metadata_.level; }
    std::string_view target() const noexcept { return metadata_.target; }
    const KeyValues &key_values() const noexcept { return key_values_; }

  private:
    Metadata metadata_;
    std::string_view args_;
    const KeyValues &key_values_;
};

// Abstract interface for a log event destination.
class LogSink
{
  public:
    virtual ~LogSink() = default;

    /// Whether the sink wants events with this metadata. Checked before formatting.
    virtual bool enabled(const Metadata &metadata) const noexcept = 0;
    /// Handles one event. Must not throw.
    virtual void log(const Event &event) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;
};

} // namespace logtest::utils
