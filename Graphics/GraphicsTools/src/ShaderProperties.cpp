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


#include "ShaderProperties.hpp"

#include <mutex>
#include <unordered_map>
#include <vector>
#include <memory>
#include <utility>

namespace Bindery
{

namespace
{

class ShaderPropertyRegistry
{
public:
    ShaderPropertyID GetID(const Char* Name)
    {
        std::lock_guard<std::mutex> Lock{m_Mtx};

        auto it = m_IDs.find(Name);
        if (it != m_IDs.end())
            return it->second;

        const auto ID = static_cast<ShaderPropertyID>(m_Names.size());
        // Names are never removed, so the pointers handed out by GetName stay valid.
        auto pName = std::make_unique<String>(Name);
        m_Names.reserve(m_Names.size() + 1);
        m_IDs.emplace(*pName, ID);
        m_Names.push_back(std::move(pName));
        return ID;
    }

    const Char* GetName(ShaderPropertyID ID)
    {
        std::lock_guard<std::mutex> Lock{m_Mtx};
        if (ID < 0 || static_cast<size_t>(ID) >= m_Names.size())
            return nullptr;
        return m_Names[ID]->c_str();
    }

private:
    std::mutex                                   m_Mtx;
    std::unordered_map<String, ShaderPropertyID> m_IDs;
    std::vector<std::unique_ptr<String>>         m_Names;
};

ShaderPropertyRegistry& GetRegistry()
{
    static ShaderPropertyRegistry Registry;
    return Registry;
}

} // namespace

ShaderPropertyID GetShaderPropertyID(const Char* Name) noexcept(false)
{
    if (Name == nullptr || *Name == '\0')
        LOG_ERROR_AND_THROW("Shader property name must not be empty");

    return GetRegistry().GetID(Name);
}

const Char* GetShaderPropertyName(ShaderPropertyID ID)
{
    return GetRegistry().GetName(ID);
}

} // namespace Bindery
