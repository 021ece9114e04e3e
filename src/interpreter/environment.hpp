#pragma once

// =============================================================================
// Environment: Lux's variable scope
// =============================================================================
//
// Each scope (global, function call, block) is an Environment: a
// name -> Value map plus a shared pointer to the enclosing scope. Frames are
// shared because a closure keeps its defining scope alive after the block or
// call that created it has returned.
//
// Two ways to reach a binding:
//
//   get() / assign()        walk the parent chain looking for the name.
//                           Used for globals, which the resolver leaves
//                           unresolved.
//
//   getAt() / assignAt()    jump exactly `distance` frames up and look
//                           only there. Used for every resolved local, so a
//                           later shadowing binding can never capture it.
//
// Misses are reported as empty results, not exceptions: the interpreter knows
// the span to blame and raises the error itself.
//
// A closure stored in the frame it captures forms a reference cycle, which
// shared_ptr cannot reclaim. clear() breaks the cycles of the global frame.
// =============================================================================

#include "value.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lux
{

    class Environment
    {
    public:
        /// Construct the global scope (no parent)
        Environment() = default;

        /// Construct a child scope
        explicit Environment(std::shared_ptr<Environment> parent) : parent_(std::move(parent)) {}

        /// New frame whose parent is `parent`
        static std::shared_ptr<Environment> extend(std::shared_ptr<Environment> parent)
        {
            return std::make_shared<Environment>(std::move(parent));
        }

        /// Create or overwrite a binding in this frame
        void define(const std::string &name, Value value)
        {
            vars_[name] = std::move(value);
        }

        /// Look up a name, walking up the scope chain
        std::optional<Value> get(const std::string &name) const
        {
            for (const Environment *env = this; env; env = env->parent_.get())
            {
                auto it = env->vars_.find(name);
                if (it != env->vars_.end())
                    return it->second;
            }
            return std::nullopt;
        }

        /// Update the nearest existing binding. Returns false if the name is
        /// not bound anywhere in the chain; nothing is created in that case.
        bool assign(const std::string &name, Value value)
        {
            for (Environment *env = this; env; env = env->parent_.get())
            {
                auto it = env->vars_.find(name);
                if (it != env->vars_.end())
                {
                    it->second = std::move(value);
                    return true;
                }
            }
            return false;
        }

        /// The frame `distance` hops up the chain (0 = this frame).
        /// nullptr if the chain is shorter than that.
        Environment *ancestor(int distance)
        {
            Environment *env = this;
            for (int i = 0; i < distance && env; i++)
                env = env->parent_.get();
            return env;
        }

        std::optional<Value> getAt(int distance, const std::string &name)
        {
            Environment *env = ancestor(distance);
            if (!env)
                return std::nullopt;
            auto it = env->vars_.find(name);
            if (it == env->vars_.end())
                return std::nullopt;
            return it->second;
        }

        bool assignAt(int distance, const std::string &name, Value value)
        {
            Environment *env = ancestor(distance);
            if (!env)
                return false;
            auto it = env->vars_.find(name);
            if (it == env->vars_.end())
                return false;
            it->second = std::move(value);
            return true;
        }

        /// Is the name bound in this frame only (parents not consulted)
        bool hasLocal(const std::string &name) const
        {
            return vars_.count(name) > 0;
        }

        const std::shared_ptr<Environment> &parent() const { return parent_; }

        /// Names bound in this frame (unordered)
        std::vector<std::string> names() const
        {
            std::vector<std::string> out;
            out.reserve(vars_.size());
            for (auto &kv : vars_)
                out.push_back(kv.first);
            return out;
        }

        /// Drop every binding in this frame
        void clear()
        {
            vars_.clear();
        }

    private:
        std::unordered_map<std::string, Value> vars_;
        std::shared_ptr<Environment> parent_;
    };

} // namespace lux
