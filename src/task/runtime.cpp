#include "task/runtime.hpp"

namespace rev::task {

Runtime& Runtime::getInstance()
{
    static absl::NoDestructor<Runtime> instance;
    return *instance;
}

} // namespace rev::task
