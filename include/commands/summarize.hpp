#pragma once

int cmd_summarize(int argc, char** argv);
