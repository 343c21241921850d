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
/// Implementation of the Bindery::DeviceContextBase template class

#include "DeviceContext.h"
#include "ObjectBase.hpp"
#include "RefCntAutoPtr.hpp"
#include "BufferBase.hpp"

namespace Bindery
{

/// Base implementation of the device context.

/// \tparam BaseInterface        - Base interface that this class will inherit.
/// \tparam RenderDeviceImplType - Type of the render device implementation.
///
/// \remarks Device context keeps strong reference to the device.
template <typename BaseInterface, typename RenderDeviceImplType>
class DeviceContextBase : public ObjectBase<BaseInterface>
{
public:
    using TObjectBase = ObjectBase<BaseInterface>;

    DeviceContextBase(RenderDeviceImplType* pRenderDevice, const DeviceContextDesc& Desc) :
        // clang-format off
        m_pDevice{pRenderDevice},
        m_Name   {Desc.Name != nullptr ? String{Desc.Name} : String{Desc.IsDeferred ? "Deferred context" : "Immediate context"}},
        m_Desc   {Desc}
    // clang-format on
    {
        m_Desc.Name = m_Name.c_str();
    }

    IMPLEMENT_QUERY_INTERFACE_IN_PLACE(IID_DeviceContext, TObjectBase)

    virtual const DeviceContextDesc& GetDesc() const override final
    {
        return m_Desc;
    }

    bool IsDeferred() const { return m_Desc.IsDeferred; }

    RenderDeviceImplType* GetDevice() { return m_pDevice; }

protected:
    /// Checks the arguments of UpdateBuffer(). Returns false if the command must be skipped.
    bool CheckUpdateBufferArgs(IBuffer* pBuffer, Uint64 Offset, Uint64 Size, const void* pData) const
    {
        if (pBuffer == nullptr)
        {
            LOG_ERROR_MESSAGE("Buffer must not be null");
            return false;
        }
        return VerifyUpdateBufferParams(pBuffer->GetDesc(), Offset, Size, pData);
    }

    /// Checks the program and kernel index passed to a SetProgram*() command
    bool CheckProgramKernel(const IShaderProgram* pProgram, Uint32 Kernel, const Char* CommandName) const
    {
        if (pProgram == nullptr)
        {
            LOG_ERROR_MESSAGE(CommandName, ": shader program must not be null");
            return false;
        }
        if (Kernel >= pProgram->GetKernelCount())
        {
            LOG_ERROR_MESSAGE(CommandName, ": kernel index ", Kernel, " is out of range for program '", pProgram->GetDesc().Name,
                              "' that has ", pProgram->GetKernelCount(), " kernel(s)");
            return false;
        }
        return true;
    }

    bool CheckFinishCommandList(ICommandList** ppCommandList) const
    {
        if (!IsDeferred())
        {
            LOG_ERROR_MESSAGE("Only deferred contexts can record command lists. '", m_Desc.Name, "' is an immediate context.");
            return false;
        }
        if (ppCommandList == nullptr)
        {
            LOG_ERROR_MESSAGE("ppCommandList must not be null");
            return false;
        }
        DEV_CHECK_ERR(*ppCommandList == nullptr, "Overwriting reference to existing command list may cause memory leaks");
        return true;
    }

    bool CheckExecuteCommandList(ICommandList* pCommandList) const
    {
        if (IsDeferred())
        {
            LOG_ERROR_MESSAGE("Only immediate context can execute command lists. '", m_Desc.Name, "' is a deferred context.");
            return false;
        }
        if (pCommandList == nullptr)
        {
            LOG_ERROR_MESSAGE("Command list must not be null");
            return false;
        }
        return true;
    }

    /// Strong reference to the device.
    RefCntAutoPtr<RenderDeviceImplType> m_pDevice;

    const String m_Name;

    DeviceContextDesc m_Desc;
};

} // namespace Bindery
