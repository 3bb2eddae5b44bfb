#ifndef GITCFG_OPTIONVALUE_H
#define GITCFG_OPTIONVALUE_H

#include <functional>
#include <ostream>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "GitCfg/Defines.h"

namespace GitCfg {
    /**
     * One recorded value of an option.
     */
    struct OptionItem {
        std::string text;
        bool implicit = false; // written as a bare key, no '='

        bool operator==(const OptionItem &rhs) const = default;
    };

    /**
     * The value(s) recorded for one option of a section.
     *
     * Holds a single item until a second value is recorded for the same key,
     * at which point it becomes an ordered list (a multivar). Removing values
     * from a multivar until one is left turns it back into a single item, so
     * callers always see the shape the file has.
     */
    class GITCFG_EXPORT OptionValue {
    public:
        using Item = OptionItem;

        using Predicate = std::function<bool(const Item &)>;

        OptionValue() = default;
        explicit OptionValue(std::string text);
        explicit OptionValue(Item item);
        explicit OptionValue(std::vector<Item> items);

        // Item recorded for a bare key
        static Item ImplicitItem();
        static OptionValue FromList(const std::vector<std::string> &values);

        bool IsMultivar() const noexcept { return std::holds_alternative<std::vector<Item>>(m_Storage); }
        size_t Size() const noexcept;
        bool Empty() const noexcept { return Size() == 0; }

        // Text of a single value, or of the last value of a multivar
        const std::string &GetString() const;
        std::vector<std::string> AsList() const;
        std::span<const Item> GetItems() const noexcept;

        // Replaces every value with the given one
        void Assign(Item item);

        // Records another value, promoting a single value to a multivar
        void Append(Item item);

        /**
         * Removes every item the predicate accepts.
         *
         * A multivar left with one item collapses to a single value; a value
         * left with none reports Empty(). Returns the number removed.
         */
        size_t RemoveIf(const Predicate &predicate);

        bool operator==(const OptionValue &rhs) const = default;
        bool operator==(const std::string &text) const;
        bool operator==(const std::vector<std::string> &values) const;

    private:
        std::variant<Item, std::vector<Item>> m_Storage;
    };

    GITCFG_EXPORT std::ostream &operator<<(std::ostream &os, const OptionValue &value);
} // namespace GitCfg

#endif // GITCFG_OPTIONVALUE_H
