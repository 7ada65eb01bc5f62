#pragma once

#include "command_queue.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace realmsim
{
    // Verb -> handler table. Filled once while the engine is assembled; lookups after
    // that are a single hash probe on the lower-cased first word of the command text.
    class CommandRegistry
    {
    public:
        using Handler = std::function<void(const Command &, std::string_view args)>;

        // All-or-nothing: if any name is empty or taken, nothing is registered.
        void register_handler(std::string verb, Handler handler, std::vector<std::string> aliases = {})
        {
            if (!handler)
            {
                throw std::runtime_error("register_handler: null handler");
            }

            std::vector<std::string> names;
            names.reserve(aliases.size() + 1);
            names.push_back(normalize_(verb));
            for (const auto &alias : aliases)
            {
                names.push_back(normalize_(alias));
            }
            for (std::size_t i = 0; i < names.size(); ++i)
            {
                const bool repeated = std::find(names.begin(), names.begin() + static_cast<std::ptrdiff_t>(i), names[i]) !=
                                      names.begin() + static_cast<std::ptrdiff_t>(i);
                if (repeated || m_handlers.count(names[i]) != 0)
                {
                    throw std::runtime_error("register_handler: duplicate verb '" + names[i] + "'");
                }
            }

            for (auto &name : names)
            {
                m_handlers.emplace(std::move(name), handler);
            }
        }

        bool contains(std::string_view verb) const
        {
            return m_handlers.find(to_lower(verb)) != m_handlers.end();
        }

        std::size_t size() const noexcept { return m_handlers.size(); }

        // Returns false if the command's verb has no handler. Handler exceptions propagate.
        bool dispatch(const Command &cmd) const
        {
            const auto [verb, args] = split_verb(cmd.text);
            auto it = m_handlers.find(verb);
            if (it == m_handlers.end())
            {
                return false;
            }
            it->second(cmd, args);
            return true;
        }

        // "Attack   Goblin " -> {"attack", "Goblin"}
        static std::pair<std::string, std::string_view> split_verb(std::string_view text)
        {
            text = trim(text);
            std::size_t end = 0;
            while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end])))
            {
                ++end;
            }
            return {to_lower(text.substr(0, end)), trim(text.substr(end))};
        }

    private:
        static std::string normalize_(std::string_view name)
        {
            std::string out = to_lower(trim(name));
            if (out.empty())
            {
                throw std::runtime_error("register_handler: empty verb");
            }
            return out;
        }

        std::unordered_map<std::string, Handler> m_handlers;
    };
}
