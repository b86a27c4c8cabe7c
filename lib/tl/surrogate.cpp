/* This file is part of Throwline project.
 * Copyright (c) 2024-2025 Throwline contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>
#include <tl/errors.hpp>
#include <tl/logger.hpp>
#include <tl/surrogate.hpp>

namespace throwline {
    namespace {
        struct discovery {
            using item = std::pair<std::string, surrogate_initializer::action>;

            alignas(mutex::alignment) std::mutex guard {};
            std::condition_variable drained_cv {};
            std::vector<item> pending {};
            surrogate_registry *installed = nullptr;
            std::thread::id installer {};
            std::atomic_bool drained { false };
        };

        discovery &discovered()
        {
            static discovery d {};
            return d;
        }

        void run_initializer(const std::string &name, const surrogate_initializer::action &act, surrogate_registry &reg)
        {
            const auto before = reg.size();
            act(reg);
            logger::debug("surrogate initializer {} registered {} factories", name, reg.size() - before);
        }

        surrogate_registry &create()
        {
            static surrogate_registry reg {};
            register_builtin_factories(reg);
            return reg;
        }

        void mark_drained(discovery &d)
        {
            {
                mutex::scoped_lock lk { d.guard };
                d.drained = true;
            }
            d.drained_cv.notify_all();
        }

        /*
         * Runs the initializers declared before the registry existed. Runs outside of any static initialization
         * so that an initializer may use surrogate_registry::get() and the free functions built on it:
         * such a nested call on the installing thread returns right away, other threads wait for the drain.
         */
        void drain(surrogate_registry &reg)
        {
            auto &d = discovered();
            if (d.drained.load(std::memory_order_acquire))
                return;
            std::vector<discovery::item> pending {};
            {
                mutex::unique_lock lk { d.guard };
                if (d.installed) {
                    if (d.installer != std::this_thread::get_id())
                        d.drained_cv.wait(lk, [&] { return d.drained.load(); });
                    return;
                }
                pending = std::move(d.pending);
                d.pending.clear();
                d.installed = &reg;
                d.installer = std::this_thread::get_id();
            }
            try {
                for (const auto &[name, act]: pending)
                    run_initializer(name, act, reg);
            } catch (...) {
                mark_drained(d);
                throw;
            }
            mark_drained(d);
            logger::info("the surrogate registry is ready with {} factories", reg.size());
        }
    }

    surrogate_registry &surrogate_registry::get()
    {
        static surrogate_registry &reg = create();
        drain(reg);
        return reg;
    }

    void surrogate_registry::add(const std::type_index type, surrogate_factory factory)
    {
        if (!factory)
            throw illegal_argument_error(fmt::format("an empty surrogate factory given for {}", demangle(type.name())));
        mutex::write_lock lk { _mutex };
        if (!_factories.try_emplace(type, std::move(factory)).second) {
            lk.unlock();
            logger::warn("a duplicate surrogate factory registration for {}", demangle(type.name()));
            throw illegal_state_error(fmt::format("surrogate factory is already registered for {}", demangle(type.name())));
        }
        lk.unlock();
        logger::debug("registered a surrogate factory for {}", demangle(type.name()));
    }

    bool surrogate_registry::contains(const std::type_index type) const
    {
        mutex::read_lock lk { _mutex };
        return _factories.contains(type);
    }

    size_t surrogate_registry::size() const
    {
        mutex::read_lock lk { _mutex };
        return _factories.size();
    }

    std::optional<surrogate_factory> surrogate_registry::_find(const std::type_index type) const
    {
        mutex::read_lock lk { _mutex };
        if (const auto it = _factories.find(type); it != _factories.end())
            return it->second;
        return {};
    }

    throwable_ptr surrogate_registry::reconstruct(const throwable_ptr &tmpl, const throwable_ptr &cause) const
    {
        if (!tmpl)
            return tmpl;
        const auto type = tmpl->type();
        // the factory runs without the lock so that it may use the registry itself
        const auto factory = _find(type);
        if (!factory) {
            logger::trace("no surrogate factory for {}, keeping the original", tmpl->type_name());
            return tmpl;
        }
        auto surrogate = (*factory)(*tmpl, cause);
        if (!surrogate)
            return tmpl;
        if (surrogate->type() != type) {
            logger::warn("the surrogate factory for {} created a value of type {}, keeping the original",
                tmpl->type_name(), surrogate->type_name());
            return tmpl;
        }
        logger::trace("created a surrogate of {}", tmpl->to_string());
        return surrogate;
    }

    surrogate_initializer::surrogate_initializer(std::string name, action act)
    {
        surrogate_registry *reg = nullptr;
        {
            auto &d = discovered();
            mutex::scoped_lock lk { d.guard };
            if (!d.installed) {
                d.pending.emplace_back(std::move(name), std::move(act));
                return;
            }
            reg = d.installed;
        }
        run_initializer(name, act, *reg);
    }
}
