#pragma once

namespace nnf {

void PushInterrupt();
void PopInterrupt();
auto InterruptReceived() -> bool;

} // namespace nnf
