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


#include "ShaderProgramHostImpl.hpp"

#include <unordered_set>

namespace Bindery
{

ShaderProgramHostImpl::ShaderProgramHostImpl(RenderDeviceHostImpl*    pDevice,
                                             const ShaderProgramDesc& ProgramDesc) :
    TDeviceObjectBase{pDevice, ProgramDesc}
{
    if (m_Desc.NumKernels == 0)
        LOG_ERROR_AND_THROW("Shader program '", m_Desc.Name, "' must contain at least one kernel");
    if (m_Desc.KernelNames == nullptr)
        LOG_ERROR_AND_THROW("Kernel names of shader program '", m_Desc.Name, "' must not be null");

    std::unordered_set<String> UniqueNames;
    m_KernelNames.reserve(m_Desc.NumKernels);
    for (Uint32 i = 0; i < m_Desc.NumKernels; ++i)
    {
        const Char* KernelName = m_Desc.KernelNames[i];
        if (KernelName == nullptr || *KernelName == '\0')
            LOG_ERROR_AND_THROW("Name of kernel ", i, " in shader program '", m_Desc.Name, "' must not be null or empty");
        if (!UniqueNames.insert(KernelName).second)
            LOG_ERROR_AND_THROW("Shader program '", m_Desc.Name, "' contains more than one kernel named '", KernelName, "'");
        m_KernelNames.emplace_back(KernelName);
    }

    // Kernel names are owned by the program
    m_KernelNamePtrs.reserve(m_KernelNames.size());
    for (const auto& Name : m_KernelNames)
        m_KernelNamePtrs.push_back(Name.c_str());
    m_Desc.KernelNames = m_KernelNamePtrs.data();

    m_KernelParams.resize(m_KernelNames.size());
}

Uint32 ShaderProgramHostImpl::FindKernel(const Char* Name) const
{
    if (Name == nullptr)
        return INVALID_KERNEL_INDEX;

    for (size_t i = 0; i < m_KernelNames.size(); ++i)
    {
        if (m_KernelNames[i] == Name)
            return static_cast<Uint32>(i);
    }
    return INVALID_KERNEL_INDEX;
}

bool ShaderProgramHostImpl::CheckKernelIndex(Uint32 Kernel, const Char* MethodName) const
{
    if (Kernel < m_KernelNames.size())
        return true;

    LOG_ERROR_MESSAGE(MethodName, ": kernel index ", Kernel, " is out of range for program '", m_Desc.Name,
                      "' that has ", m_KernelNames.size(), " kernel(s)");
    return false;
}

void ShaderProgramHostImpl::SetConstantBuffer(ShaderPropertyID Slot, IBuffer* pBuffer, Uint32 Offset, Uint32 Size)
{
    m_ProgramParams.SetConstantBuffer(Slot, pBuffer, Offset, Size);
}

void ShaderProgramHostImpl::SetBuffer(Uint32 Kernel, ShaderPropertyID Slot, IBuffer* pBuffer)
{
    if (!CheckKernelIndex(Kernel, "SetBuffer"))
        return;
    m_KernelParams[Kernel].SetBuffer(Slot, pBuffer);
}

void ShaderProgramHostImpl::SetTexture(Uint32 Kernel, ShaderPropertyID Slot, ITexture* pTexture)
{
    if (!CheckKernelIndex(Kernel, "SetTexture"))
        return;
    m_KernelParams[Kernel].SetTexture(Slot, pTexture);
}

void ShaderProgramHostImpl::SetKeyword(const Char* Name, bool Enable)
{
    m_ProgramParams.SetKeyword(Name, Enable);
}

const ParameterBlockHost& ShaderProgramHostImpl::GetKernelParameters(Uint32 Kernel) const
{
    if (!CheckKernelIndex(Kernel, "GetKernelParameters"))
        LOG_ERROR_AND_THROW("Invalid kernel index");
    return m_KernelParams[Kernel];
}

} // namespace Bindery
