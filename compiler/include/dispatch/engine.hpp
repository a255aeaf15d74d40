//! # Dispatch Engine
//!
//! Runtime counterpart of generated CLI code: routes an argument vector to a
//! registered handler, or prints help.
//!
//! ## Example
//!
//! ```cpp
//! class RemoteAdd : public CommandHandler {
//! public:
//!     auto execute(const Invocation& inv) -> Result<int, std::string> override {
//!         std::cout << "adding " << *inv.params.arg("name") << "\n";
//!         return 0;
//!     }
//! };
//!
//! Engine engine(std::move(resolved), std::cout);
//! engine.register_handler("remote/add", std::make_unique<RemoteAdd>());
//! auto result = engine.run({"remote", "add", "origin"});
//! ```

#ifndef CDL_DISPATCH_ENGINE_HPP
#define CDL_DISPATCH_ENGINE_HPP

#include "dispatch/dispatch.hpp"
#include "dispatch/help.hpp"

#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace cdl::dispatch {

/// Execution capability of one leaf command.
class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    /// Returns the process exit code, or an error message.
    virtual auto execute(const Invocation& invocation) -> Result<int, std::string> = 0;
};

class Engine {
public:
    Engine(sema::ResolvedTree tree, std::ostream& out);

    Engine(const Engine&) = delete;
    auto operator=(const Engine&) -> Engine& = delete;

    /// Replaces any handler already registered for `path`.
    void register_handler(const std::string& path, std::unique_ptr<CommandHandler> handler);

    [[nodiscard]] auto has_handler(const std::string& path) const -> bool;

    /// Dispatches `args`. Help requests print help and return 0.
    auto run(const std::vector<std::string>& args) -> Result<int, std::string>;

    void set_color_enabled(bool enabled) {
        help_.set_color_enabled(enabled);
    }

    [[nodiscard]] auto tree() const -> const sema::ResolvedTree& {
        return tree_;
    }

private:
    sema::ResolvedTree tree_;
    Dispatcher dispatcher_;
    HelpPrinter help_;
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

} // namespace cdl::dispatch

#endif // CDL_DISPATCH_ENGINE_HPP
