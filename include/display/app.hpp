#pragma once

#include "display/component.hpp"

#include <deque>
#include <map>
#include <memory>
#include <string>

namespace rev::display {

class Terminal;

struct AppOptions {
    int tick_ms {100};
};

/// Page registry plus the tick/render loop. Single threaded: producers only
/// reach it through the channels the pages poll.
class App
{
public:
    explicit App(AppOptions options = {}) : options_(options) {}

    void registerPage(const std::string& name, std::unique_ptr<Component> page);

    /// Runs until Quit. `start_page` receives the first GotoPage.
    void run(const std::string& start_page);

    /// Applies one action to the app and the current page. Exposed for tests.
    void dispatch(const Action& action);
    void drain();

    const std::string& currentPage() const { return current_; }
    bool shouldQuit() const { return should_quit_; }
    const std::string& lastError() const { return last_error_; }

    void push(Action action) { queue_.push_back(std::move(action)); }

private:
    Component* page();
    void render();

    AppOptions  options_;
    std::map<std::string, std::unique_ptr<Component>> pages_;
    std::string current_;
    std::deque<Action> queue_;
    bool        should_quit_ {false};
    Terminal*   term_        {nullptr};   ///< set only inside run()
    std::string last_error_;
};

} // namespace rev::display
