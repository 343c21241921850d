/*
 *  Copyright 2024 Diligent Graphics LLC
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing, software
 *  distributed under the License is distributed on an "AS IS" BASIS,
 *  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *  See the License for the specific language governing permissions and
 *  limitations under the License.
 *
 *  In no event and under no legal theory, whether in tort (including negligence),
 *  contract, or otherwise, unless required by applicable law (such as deliberate
 *  and grossly negligent acts) or agreed to in writing, shall any Contributor be
 *  liable for any damages, including any direct, indirect, special, incidental,
 *  or consequential damages of any character arising as a result of this License or
 *  out of the use or inability to use the software (including but not limited to damages
 *  for loss of goodwill, work stoppage, computer failure or malfunction, or any and
 *  all other commercial damages or losses), even if such Contributor has been advised
 *  of the possibility of such damages.
 */


#pragma once

/// \file
/// Defines Bindery::ICommandList interface

#include "DeviceObject.h"

namespace Bindery
{

// {C38C68F2-8A85-4ED5-B7D4-D7B2B6B5F6E1}
static constexpr INTERFACE_ID IID_CommandList =
    {0xc38c68f2, 0x8a85, 0x4ed5, {0xb7, 0xd4, 0xd7, 0xb2, 0xb6, 0xb5, 0xf6, 0xe1}};

/// Command list interface

/// Command list has no methods. It is created by IDeviceContext::FinishCommandList()
/// and consumed by IDeviceContext::ExecuteCommandList().
class ICommandList : public IDeviceObject
{
};

} // namespace Bindery
