#pragma once

#include <string>
#include "runner/submission.hpp"

namespace runner {

/**
 * @brief 把多个源文件拼接成一个源文件
 * 远程评测服务只接受一份源代码，因此需要把所有文件按请求中的顺序拼接起来，
 * 每个文件前加一行 "<注释前缀> FILE: <文件名>" 作为分隔，每个文件后空一行：
 * @code
 *     // FILE: Main.java
 *     public class Main { ... }
 *
 *     // FILE: Util.java
 *     class Util { ... }
 *
 * @endcode
 * 如果后端不支持二进制附件，jar 会以 "<注释前缀> JAR:<名字>:<base64 内容>" 的形式追加在末尾，
 * 拼接器不会解码或执行这些内容。
 *
 * @param files 源文件，按插入顺序输出
 * @param jars 依赖的二进制文件，内容保持 base64 编码
 * @param comment_token 语言的单行注释前缀
 * @param attach_jars 是否把 jars 以注释的形式附加到末尾
 */
std::string assemble_source(const file_list &files, const file_list &jars, const std::string &comment_token, bool attach_jars = true);

}  // namespace runner
