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


#include "DeviceContextHostImpl.hpp"

#include <cstring>

#include "BufferHostImpl.hpp"
#include "CommandListHostImpl.hpp"
#include "ShaderGlobalsHostImpl.hpp"

namespace Bindery
{

const Char* GetHostCommandTypeString(HOST_COMMAND_TYPE Type)
{
    static_assert(HOST_COMMAND_TYPE_COUNT == 9, "Please update the switch below to handle the new command type");
    switch (Type)
    {
        // clang-format off
        case HOST_COMMAND_UPDATE_BUFFER:               return "UpdateBuffer";
        case HOST_COMMAND_SET_PROGRAM_CONSTANT_BUFFER: return "SetProgramConstantBuffer";
        case HOST_COMMAND_SET_PROGRAM_BUFFER:          return "SetProgramBuffer";
        case HOST_COMMAND_SET_PROGRAM_TEXTURE:         return "SetProgramTexture";
        case HOST_COMMAND_SET_PROGRAM_KEYWORD:         return "SetProgramKeyword";
        case HOST_COMMAND_SET_GLOBAL_CONSTANT_BUFFER:  return "SetGlobalConstantBuffer";
        case HOST_COMMAND_SET_GLOBAL_BUFFER:           return "SetGlobalBuffer";
        case HOST_COMMAND_SET_GLOBAL_TEXTURE:          return "SetGlobalTexture";
        case HOST_COMMAND_SET_GLOBAL_KEYWORD:          return "SetGlobalKeyword";
        // clang-format on
        default:
            UNEXPECTED("Unknown command type");
            return "<Unknown command>";
    }
}

DeviceContextHostImpl::DeviceContextHostImpl(RenderDeviceHostImpl* pDevice, const DeviceContextDesc& Desc) :
    TDeviceContextBase{pDevice, Desc}
{
}

bool DeviceContextHostImpl::ValidationEnabled() const
{
    return m_pDevice->GetEngineCreateInfo().EnableValidation;
}

void DeviceContextHostImpl::UpdateBuffer(IBuffer* pBuffer, Uint64 Offset, Uint64 Size, const void* pData)
{
    // Buffer bounds are always checked as the command writes to the buffer storage
    if (!CheckUpdateBufferArgs(pBuffer, Offset, Size, pData))
        return;

    HostCommand Cmd{HOST_COMMAND_UPDATE_BUFFER};
    Cmd.pBuffer = pBuffer;
    Cmd.Offset  = Offset;
    Cmd.Size    = Size;
    if (IsDeferred())
    {
        // The data must be copied as the caller may release it right after the call
        const auto* pSrc = static_cast<const Uint8*>(pData);
        Cmd.Data.assign(pSrc, pSrc + Size);
        m_RecordedCommands.emplace_back(std::move(Cmd));
    }
    else
    {
        CHECK_DYNAMIC_TYPE(BufferHostImpl, pBuffer);
        static_cast<BufferHostImpl*>(pBuffer)->Update(Offset, Size, pData);
    }
}

void DeviceContextHostImpl::SetProgramConstantBuffer(IShaderProgram* pProgram, ShaderPropertyID Slot, IBuffer* pBuffer, Uint32 Offset, Uint32 Size)
{
    if (pProgram == nullptr)
    {
        LOG_ERROR_MESSAGE("SetProgramConstantBuffer: shader program must not be null");
        return;
    }

    HostCommand Cmd{HOST_COMMAND_SET_PROGRAM_CONSTANT_BUFFER};
    Cmd.pProgram = pProgram;
    Cmd.Slot     = Slot;
    Cmd.pBuffer  = pBuffer;
    Cmd.Offset   = Offset;
    Cmd.Size     = Size;
    Submit(std::move(Cmd));
}

void DeviceContextHostImpl::SetProgramBuffer(IShaderProgram* pProgram, Uint32 Kernel, ShaderPropertyID Slot, IBuffer* pBuffer)
{
    if (ValidationEnabled() ? !CheckProgramKernel(pProgram, Kernel, "SetProgramBuffer") : pProgram == nullptr)
        return;

    HostCommand Cmd{HOST_COMMAND_SET_PROGRAM_BUFFER};
    Cmd.pProgram = pProgram;
    Cmd.Kernel   = Kernel;
    Cmd.Slot     = Slot;
    Cmd.pBuffer  = pBuffer;
    Submit(std::move(Cmd));
}

void DeviceContextHostImpl::SetProgramTexture(IShaderProgram* pProgram, Uint32 Kernel, ShaderPropertyID Slot, ITexture* pTexture)
{
    if (ValidationEnabled() ? !CheckProgramKernel(pProgram, Kernel, "SetProgramTexture") : pProgram == nullptr)
        return;

    HostCommand Cmd{HOST_COMMAND_SET_PROGRAM_TEXTURE};
    Cmd.pProgram = pProgram;
    Cmd.Kernel   = Kernel;
    Cmd.Slot     = Slot;
    Cmd.pTexture = pTexture;
    Submit(std::move(Cmd));
}

void DeviceContextHostImpl::SetProgramKeyword(IShaderProgram* pProgram, const Char* Name, bool Enable)
{
    if (pProgram == nullptr || Name == nullptr)
    {
        LOG_ERROR_MESSAGE("SetProgramKeyword: shader program and keyword name must not be null");
        return;
    }

    HostCommand Cmd{HOST_COMMAND_SET_PROGRAM_KEYWORD};
    Cmd.pProgram = pProgram;
    Cmd.Keyword  = Name;
    Cmd.Enable   = Enable;
    Submit(std::move(Cmd));
}

void DeviceContextHostImpl::SetGlobalConstantBuffer(ShaderPropertyID Slot, IBuffer* pBuffer, Uint32 Offset, Uint32 Size)
{
    HostCommand Cmd{HOST_COMMAND_SET_GLOBAL_CONSTANT_BUFFER};
    Cmd.Slot    = Slot;
    Cmd.pBuffer = pBuffer;
    Cmd.Offset  = Offset;
    Cmd.Size    = Size;
    Submit(std::move(Cmd));
}

void DeviceContextHostImpl::SetGlobalBuffer(ShaderPropertyID Slot, IBuffer* pBuffer)
{
    HostCommand Cmd{HOST_COMMAND_SET_GLOBAL_BUFFER};
    Cmd.Slot    = Slot;
    Cmd.pBuffer = pBuffer;
    Submit(std::move(Cmd));
}

void DeviceContextHostImpl::SetGlobalTexture(ShaderPropertyID Slot, ITexture* pTexture)
{
    HostCommand Cmd{HOST_COMMAND_SET_GLOBAL_TEXTURE};
    Cmd.Slot     = Slot;
    Cmd.pTexture = pTexture;
    Submit(std::move(Cmd));
}

void DeviceContextHostImpl::SetGlobalKeyword(const Char* Name, bool Enable)
{
    if (Name == nullptr)
    {
        LOG_ERROR_MESSAGE("SetGlobalKeyword: keyword name must not be null");
        return;
    }

    HostCommand Cmd{HOST_COMMAND_SET_GLOBAL_KEYWORD};
    Cmd.Keyword = Name;
    Cmd.Enable  = Enable;
    Submit(std::move(Cmd));
}

void DeviceContextHostImpl::Submit(HostCommand&& Cmd)
{
    if (IsDeferred())
        m_RecordedCommands.emplace_back(std::move(Cmd));
    else
        ExecuteCommand(Cmd);
}

void DeviceContextHostImpl::ExecuteCommand(HostCommand& Cmd)
{
    IShaderGlobals* pGlobals = m_pDevice->GetShaderGlobals();

    switch (Cmd.Type)
    {
        case HOST_COMMAND_UPDATE_BUFFER:
        {
            IBuffer* pBuffer = Cmd.pBuffer;
            CHECK_DYNAMIC_TYPE(BufferHostImpl, pBuffer);
            static_cast<BufferHostImpl*>(pBuffer)->Update(Cmd.Offset, Cmd.Size, Cmd.Data.data());
            break;
        }

        case HOST_COMMAND_SET_PROGRAM_CONSTANT_BUFFER:
            Cmd.pProgram->SetConstantBuffer(Cmd.Slot, Cmd.pBuffer, static_cast<Uint32>(Cmd.Offset), static_cast<Uint32>(Cmd.Size));
            break;

        case HOST_COMMAND_SET_PROGRAM_BUFFER:
            Cmd.pProgram->SetBuffer(Cmd.Kernel, Cmd.Slot, Cmd.pBuffer);
            break;

        case HOST_COMMAND_SET_PROGRAM_TEXTURE:
            Cmd.pProgram->SetTexture(Cmd.Kernel, Cmd.Slot, Cmd.pTexture);
            break;

        case HOST_COMMAND_SET_PROGRAM_KEYWORD:
            Cmd.pProgram->SetKeyword(Cmd.Keyword.c_str(), Cmd.Enable);
            break;

        case HOST_COMMAND_SET_GLOBAL_CONSTANT_BUFFER:
            pGlobals->SetGlobalConstantBuffer(Cmd.Slot, Cmd.pBuffer, static_cast<Uint32>(Cmd.Offset), static_cast<Uint32>(Cmd.Size));
            break;

        case HOST_COMMAND_SET_GLOBAL_BUFFER:
            pGlobals->SetGlobalBuffer(Cmd.Slot, Cmd.pBuffer);
            break;

        case HOST_COMMAND_SET_GLOBAL_TEXTURE:
            pGlobals->SetGlobalTexture(Cmd.Slot, Cmd.pTexture);
            break;

        case HOST_COMMAND_SET_GLOBAL_KEYWORD:
            if (Cmd.Enable)
                pGlobals->EnableKeyword(Cmd.Keyword.c_str());
            else
                pGlobals->DisableKeyword(Cmd.Keyword.c_str());
            break;

        default:
            UNEXPECTED("Unexpected command type ", Uint32{Cmd.Type});
    }
}

void DeviceContextHostImpl::FinishCommandList(ICommandList** ppCommandList)
{
    if (!CheckFinishCommandList(ppCommandList))
        return;

    const auto ListName = FormatString(m_Desc.Name, " command list ", m_NumCommandLists++);

    std::vector<HostCommand> Commands;
    Commands.swap(m_RecordedCommands);

    CommandListHostImpl* pCmdListHost = new CommandListHostImpl{m_pDevice, DeviceObjectAttribs{ListName.c_str()}, std::move(Commands)};
    pCmdListHost->QueryInterface(IID_CommandList, reinterpret_cast<IObject**>(ppCommandList));
}

void DeviceContextHostImpl::ExecuteCommandList(ICommandList* pCommandList)
{
    if (!CheckExecuteCommandList(pCommandList))
        return;

    CHECK_DYNAMIC_TYPE(CommandListHostImpl, pCommandList);
    auto* pCmdListHost = static_cast<CommandListHostImpl*>(pCommandList);
    for (auto& Cmd : pCmdListHost->GetCommands())
    {
        ExecuteCommand(Cmd);
    }
}

} // namespace Bindery
