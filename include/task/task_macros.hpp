#pragma once
#include "task/init_task.hpp"
#include "task/ui_task.hpp"

#define REV_INIT_TASK()  ::rev::task::Init()
#define REV_UI_TASK()    ::rev::task::StartUi()
