#pragma once

int cmd_list(int argc, char** argv);
int cmd_search(int argc, char** argv);
int cmd_show(int argc, char** argv);
int cmd_delete(int argc, char** argv);
int cmd_clear(int argc, char** argv);
