#include "GitCfg/OptionValue.h"

#include <algorithm>
#include <utility>

namespace GitCfg {
    OptionValue::OptionValue(std::string text) : m_Storage(Item{std::move(text), false}) {}

    OptionValue::OptionValue(Item item) : m_Storage(std::move(item)) {}

    OptionValue::OptionValue(std::vector<Item> items) : m_Storage(std::move(items)) {
        auto &stored = std::get<std::vector<Item>>(m_Storage);
        if (stored.size() == 1) {
            Item only = std::move(stored.front());
            m_Storage = std::move(only);
        }
    }

    OptionValue::Item OptionValue::ImplicitItem() {
        return Item{GITCFG_IMPLICIT_VALUE, true};
    }

    OptionValue OptionValue::FromList(const std::vector<std::string> &values) {
        std::vector<Item> items;
        items.reserve(values.size());
        for (const auto &value : values) {
            items.push_back(Item{value, false});
        }
        return OptionValue(std::move(items));
    }

    size_t OptionValue::Size() const noexcept {
        if (const auto *items = std::get_if<std::vector<Item>>(&m_Storage))
            return items->size();
        return 1;
    }

    const std::string &OptionValue::GetString() const {
        if (const auto *item = std::get_if<Item>(&m_Storage))
            return item->text;

        const auto &items = std::get<std::vector<Item>>(m_Storage);
        if (items.empty()) {
            static const std::string empty;
            return empty;
        }
        return items.back().text;
    }

    std::vector<std::string> OptionValue::AsList() const {
        std::vector<std::string> result;
        for (const auto &item : GetItems()) {
            result.push_back(item.text);
        }
        return result;
    }

    std::span<const OptionValue::Item> OptionValue::GetItems() const noexcept {
        if (const auto *item = std::get_if<Item>(&m_Storage))
            return {item, 1};

        const auto &items = std::get<std::vector<Item>>(m_Storage);
        return {items.data(), items.size()};
    }

    void OptionValue::Assign(Item item) {
        m_Storage = std::move(item);
    }

    void OptionValue::Append(Item item) {
        if (auto *single = std::get_if<Item>(&m_Storage)) {
            std::vector<Item> items;
            items.reserve(2);
            items.push_back(std::move(*single));
            items.push_back(std::move(item));
            m_Storage = std::move(items);
        } else {
            std::get<std::vector<Item>>(m_Storage).push_back(std::move(item));
        }
    }

    size_t OptionValue::RemoveIf(const Predicate &predicate) {
        if (auto *single = std::get_if<Item>(&m_Storage)) {
            if (!predicate(*single))
                return 0;
            m_Storage = std::vector<Item>();
            return 1;
        }

        auto &items = std::get<std::vector<Item>>(m_Storage);
        auto it = std::remove_if(items.begin(), items.end(), predicate);
        size_t removed = static_cast<size_t>(items.end() - it);
        items.erase(it, items.end());

        // Revert to a single value if only one is left
        if (removed > 0 && items.size() == 1) {
            Item last = std::move(items.front());
            m_Storage = std::move(last);
        }
        return removed;
    }

    bool OptionValue::operator==(const std::string &text) const {
        const auto *item = std::get_if<Item>(&m_Storage);
        return item && item->text == text;
    }

    bool OptionValue::operator==(const std::vector<std::string> &values) const {
        const auto *items = std::get_if<std::vector<Item>>(&m_Storage);
        if (!items || items->size() != values.size())
            return false;
        return std::equal(items->begin(), items->end(), values.begin(),
                          [](const Item &item, const std::string &value) { return item.text == value; });
    }

    std::ostream &operator<<(std::ostream &os, const OptionValue &value) {
        if (!value.IsMultivar())
            return os << '"' << value.GetString() << '"';

        os << '[';
        bool first = true;
        for (const auto &item : value.GetItems()) {
            if (!first)
                os << ", ";
            os << '"' << item.text << '"';
            first = false;
        }
        return os << ']';
    }
} // namespace GitCfg
