#pragma once

namespace bob::process {

class Runner;

// True when any process whose name contains "nvim" is running.
bool isEditorRunning(Runner& runner);

}
