#pragma once

int cmd_reconcile(int argc, char** argv);
