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


#include "BindTarget.hpp"

#include "DebugUtilities.hpp"

namespace Bindery
{

const Char* GetBindTargetTypeString(BIND_TARGET_TYPE Type)
{
    static_assert(BIND_TARGET_TYPE_COUNT == 5, "Please update the switch below to handle the new bind target type");
    switch (Type)
    {
        // clang-format off
        case BIND_TARGET_DISPATCH:              return "Dispatch";
        case BIND_TARGET_COMMAND_LIST_DISPATCH: return "Command list dispatch";
        case BIND_TARGET_GLOBAL:                return "Global";
        case BIND_TARGET_COMMAND_LIST_GLOBAL:   return "Command list global";
        case BIND_TARGET_MATERIAL:              return "Material";
        // clang-format on
        default:
            UNEXPECTED("Unexpected bind target type");
            return "Unknown";
    }
}

BindTarget BindTarget::Dispatch(IShaderProgram* pProgram, Uint32 Kernel)
{
    VERIFY(pProgram != nullptr, "Shader program must not be null");
    BindTarget Target{BIND_TARGET_DISPATCH};
    Target.m_Dispatch = {pProgram, Kernel};
    return Target;
}

BindTarget BindTarget::CommandListDispatch(IDeviceContext* pContext, IShaderProgram* pProgram, Uint32 Kernel)
{
    VERIFY(pContext != nullptr, "Device context must not be null");
    VERIFY(pProgram != nullptr, "Shader program must not be null");
    BindTarget Target{BIND_TARGET_COMMAND_LIST_DISPATCH};
    Target.m_CmdListDispatch = {pContext, pProgram, Kernel};
    return Target;
}

BindTarget BindTarget::Global(IShaderGlobals* pGlobals)
{
    VERIFY(pGlobals != nullptr, "Shader globals must not be null");
    BindTarget Target{BIND_TARGET_GLOBAL};
    Target.m_Global = {pGlobals};
    return Target;
}

BindTarget BindTarget::CommandListGlobal(IDeviceContext* pContext)
{
    VERIFY(pContext != nullptr, "Device context must not be null");
    BindTarget Target{BIND_TARGET_COMMAND_LIST_GLOBAL};
    Target.m_CmdListGlobal = {pContext};
    return Target;
}

BindTarget BindTarget::Material(IMaterial* pMaterial)
{
    VERIFY(pMaterial != nullptr, "Material must not be null");
    BindTarget Target{BIND_TARGET_MATERIAL};
    Target.m_Material = {pMaterial};
    return Target;
}

void BindTarget::BindConstantBuffer(ShaderPropertyID Slot, IBuffer* pBuffer) const
{
    const Uint32 Size = pBuffer->GetDesc().ElementByteStride;
    switch (m_Type)
    {
        case BIND_TARGET_DISPATCH:
            m_Dispatch.pProgram->SetConstantBuffer(Slot, pBuffer, 0, Size);
            break;

        case BIND_TARGET_COMMAND_LIST_DISPATCH:
            m_CmdListDispatch.pContext->SetProgramConstantBuffer(m_CmdListDispatch.pProgram, Slot, pBuffer, 0, Size);
            break;

        case BIND_TARGET_GLOBAL:
            m_Global.pGlobals->SetGlobalConstantBuffer(Slot, pBuffer, 0, Size);
            break;

        case BIND_TARGET_COMMAND_LIST_GLOBAL:
            m_CmdListGlobal.pContext->SetGlobalConstantBuffer(Slot, pBuffer, 0, Size);
            break;

        case BIND_TARGET_MATERIAL:
            m_Material.pMaterial->SetConstantBuffer(Slot, pBuffer, 0, Size);
            break;

        default:
            UNEXPECTED("Unexpected bind target type");
    }
}

void BindTarget::BindComputeBuffer(ShaderPropertyID Slot, IBuffer* pBuffer) const
{
    switch (m_Type)
    {
        case BIND_TARGET_DISPATCH:
            m_Dispatch.pProgram->SetBuffer(m_Dispatch.Kernel, Slot, pBuffer);
            break;

        case BIND_TARGET_COMMAND_LIST_DISPATCH:
            m_CmdListDispatch.pContext->SetProgramBuffer(m_CmdListDispatch.pProgram, m_CmdListDispatch.Kernel, Slot, pBuffer);
            break;

        case BIND_TARGET_GLOBAL:
            m_Global.pGlobals->SetGlobalBuffer(Slot, pBuffer);
            break;

        case BIND_TARGET_COMMAND_LIST_GLOBAL:
            m_CmdListGlobal.pContext->SetGlobalBuffer(Slot, pBuffer);
            break;

        case BIND_TARGET_MATERIAL:
            m_Material.pMaterial->SetBuffer(Slot, pBuffer);
            break;

        default:
            UNEXPECTED("Unexpected bind target type");
    }
}

void BindTarget::BindComputeTexture(ShaderPropertyID Slot, ITexture* pTexture) const
{
    switch (m_Type)
    {
        case BIND_TARGET_DISPATCH:
            m_Dispatch.pProgram->SetTexture(m_Dispatch.Kernel, Slot, pTexture);
            break;

        case BIND_TARGET_COMMAND_LIST_DISPATCH:
            m_CmdListDispatch.pContext->SetProgramTexture(m_CmdListDispatch.pProgram, m_CmdListDispatch.Kernel, Slot, pTexture);
            break;

        case BIND_TARGET_GLOBAL:
            m_Global.pGlobals->SetGlobalTexture(Slot, pTexture);
            break;

        case BIND_TARGET_COMMAND_LIST_GLOBAL:
            m_CmdListGlobal.pContext->SetGlobalTexture(Slot, pTexture);
            break;

        case BIND_TARGET_MATERIAL:
            m_Material.pMaterial->SetTexture(Slot, pTexture);
            break;

        default:
            UNEXPECTED("Unexpected bind target type");
    }
}

void BindTarget::BindKeyword(const Char* Name, bool Enable) const
{
    switch (m_Type)
    {
        case BIND_TARGET_DISPATCH:
            m_Dispatch.pProgram->SetKeyword(Name, Enable);
            break;

        case BIND_TARGET_COMMAND_LIST_DISPATCH:
            m_CmdListDispatch.pContext->SetProgramKeyword(m_CmdListDispatch.pProgram, Name, Enable);
            break;

        case BIND_TARGET_GLOBAL:
            if (Enable)
                m_Global.pGlobals->EnableKeyword(Name);
            else
                m_Global.pGlobals->DisableKeyword(Name);
            break;

        case BIND_TARGET_COMMAND_LIST_GLOBAL:
            m_CmdListGlobal.pContext->SetGlobalKeyword(Name, Enable);
            break;

        case BIND_TARGET_MATERIAL:
            m_Material.pMaterial->SetKeyword(Name, Enable);
            break;

        default:
            UNEXPECTED("Unexpected bind target type");
    }
}

} // namespace Bindery
